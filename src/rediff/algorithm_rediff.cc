#include "algorithm_rediff.hpp"

#include "algorithms/myers_greedy.hpp"
#include "algorithms/patience.hpp"
#include "processing/diff_hunk.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

using namespace effdiff;

effdiff::AlgorithmRediff::AlgorithmRediff(Algo algorithm, int64_t context_lines)
    : algorithm_(algorithm), context_lines_(context_lines) {
}

RediffResult
effdiff::AlgorithmRediff::rediff(const std::string& old_text, const std::string& new_text) const {
    RediffResult result;

    std::vector<Line> a;
    std::vector<Line> b;
    parselines(old_text, a);
    parselines(new_text, b);

    DiffInput<Line> diff_input{a, b};
    DiffResult diff_result;
    switch (algorithm_) {
        case Algo::kMyersGreedy: {
            MyersGreedy<Line> differ{diff_input};
            diff_result = differ.compute();
        } break;
        case Algo::kPatience: {
            Patience<Line> differ{diff_input};
            diff_result = differ.compute();
        } break;
        case Algo::kInvalid:
            result.error = "no diff algorithm selected";
            return result;
    }

    switch (diff_result.status) {
        case DiffResultStatus::Failed:
            result.error = fmt::format("{} diff failed on {} and {} lines", to_string(algorithm_), a.size(), b.size());
            return result;
        case DiffResultStatus::NoChanges:
            break;
        case DiffResultStatus::OK:
            result.hunks = compose_hunks(diff_result.edit_sequence, a, b, context_lines_);
            break;
    }

    result.status = RediffStatus::kOk;
    return result;
}
