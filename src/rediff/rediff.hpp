#pragma once

/*
    Re-diff collaborator.

    Given the old and new text of a region, produce hunks whose line numbers
    are 1-based and local to the two texts. Implementations must be safe to
    call concurrently from several threads.
*/

#include "model/git_diff.hpp"

#include <string>
#include <vector>

namespace effdiff {

enum class RediffStatus {
    kOk,
    kFailed,
};

struct RediffResult {
    RediffStatus status = RediffStatus::kFailed;
    std::vector<Hunk> hunks;
    std::string error;

    bool
    is_ok() const {
        return status == RediffStatus::kOk;
    }
};

class Rediff {
   public:
    virtual ~Rediff() = default;

    virtual RediffResult
    rediff(const std::string& old_text, const std::string& new_text) const = 0;
};

}  // namespace effdiff
