#pragma once

/*
    Read `git diff` style unified diff text into the diff model.

    File pairs are introduced by `diff --git` lines or by a bare `---`/`+++`
    header pair. Hunk bodies are consumed by their header counts, so removed
    lines that happen to start with "--" are never mistaken for headers.
*/

#include "model/git_diff.hpp"

#include <string>

namespace effdiff {

// clang-format off
enum class DiffParseErrorKind {
    None         = 1 << 0,
    HunkHeader   = 1 << 1, // Malformed @@ line
    Orphan       = 1 << 2, // Hunk without a preceding file header
    Truncated    = 1 << 3, // Input ended inside a hunk
    UnknownLine  = 1 << 4, // Unexpected marker inside a hunk body
};
// clang-format on

struct DiffParseResult {
    DiffParseErrorKind kind = DiffParseErrorKind::None;
    std::string error;
    int64_t line = 0;

    bool
    is_ok() const {
        return kind == DiffParseErrorKind::None;
    }
};

bool
parse_unified_diff(const std::string& diff_text,
                   const std::string& commit_hash,
                   GitDiff& result_diff,
                   DiffParseResult& result);

}  // namespace effdiff
