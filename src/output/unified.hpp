#pragma once

#include "model/git_diff.hpp"

#include <string>
#include <vector>

namespace effdiff {

// Render a diff as `git diff` style text, one string per output line.
std::vector<std::string>
unified_diff_render(const GitDiff& diff);

std::string
unified_diff_string(const GitDiff& diff);

}  // namespace effdiff
