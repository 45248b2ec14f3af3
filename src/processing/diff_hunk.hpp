#pragma once

/*
    Compose diff hunks out of an edit sequence.

    The hunks carry the text of both inputs and 1-based line numbers local
    to them, ready to be rendered as a unified diff or remapped elsewhere.
*/

#include "algorithms/algorithm.hpp"
#include "model/git_diff.hpp"
#include "util/readlines.hpp"

#include <gsl/span>

namespace effdiff {

std::vector<Hunk>
compose_hunks(const std::vector<Edit>& edit_sequence,
              gsl::span<const Line> a,
              gsl::span<const Line> b,
              const int64_t context_size);

}  // namespace effdiff
