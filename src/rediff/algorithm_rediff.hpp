#pragma once

#include "config/config.hpp"
#include "rediff/rediff.hpp"

namespace effdiff {

// Re-diff with one of the in-process line differs.
class AlgorithmRediff : public Rediff {
   public:
    AlgorithmRediff(Algo algorithm, int64_t context_lines);

    RediffResult
    rediff(const std::string& old_text, const std::string& new_text) const override;

   private:
    Algo algorithm_;
    int64_t context_lines_;
};

}  // namespace effdiff
