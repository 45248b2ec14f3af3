#pragma once

/*
    Line diff algorithms used to re-diff residual regions.

    An algorithm turns sequence A into sequence B through an edit sequence
    of deletions, insertions and common units. Indices in an edit are
    0-based positions into A and B.
*/

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string>
#include <vector>

namespace effdiff {

using std::int64_t;
using std::size_t;

struct Coordinate {
    int64_t x;
    int64_t y;
};

struct Move {
    Coordinate from;
    Coordinate to;
};

enum class EditType {
    Delete,
    Insert,
    Common,
};

struct EditIndex {
    bool valid;
    int64_t value;
    EditIndex() : valid(false), value(0) {
    }

    EditIndex(int64_t in_value) : valid(true), value(in_value) {
    }

    operator int64_t() const {
        return value;
    }
};

const EditIndex EditIndexInvalid{};

struct Edit {
    EditType type;

    EditIndex a_index;
    EditIndex b_index;
};

enum class DiffResultStatus {
    OK,
    Failed,
    NoChanges,
};

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;
};

struct DiffResult {
    DiffResultStatus status = DiffResultStatus::Failed;
    std::vector<Edit> edit_sequence;
};

template <typename Unit>
class Algorithm {
   public:
    DiffInput<Unit> diff_input_;

    explicit Algorithm(DiffInput<Unit> diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    virtual DiffResult
    diff() = 0;

    // Handles the trivial cases before dispatching to the algorithm proper.
    DiffResult
    compute() {
        DiffResult result;

        const auto N = static_cast<int64_t>(diff_input_.A.size());
        const auto M = static_cast<int64_t>(diff_input_.B.size());

        if (N == 0 && M == 0) {
            result.status = DiffResultStatus::NoChanges;
            return result;
        }

        if (N == 0) {
            for (int64_t i = 0; i < M; i++) {
                result.edit_sequence.push_back({EditType::Insert, EditIndexInvalid, EditIndex(i)});
            }
            result.status = DiffResultStatus::OK;
            return result;
        }

        if (M == 0) {
            for (int64_t i = 0; i < N; i++) {
                result.edit_sequence.push_back({EditType::Delete, EditIndex(i), EditIndexInvalid});
            }
            result.status = DiffResultStatus::OK;
            return result;
        }

        return diff();
    }
};

}  // namespace effdiff
