#pragma once

/*
    Tag every line of the original diff for presentation: plain context and
    changes, and the added and removed lines that belong to a reported move.
*/

#include "model/git_diff.hpp"
#include "processing/move_report.hpp"

#include <string>
#include <vector>

namespace effdiff {

enum class LineClass {
    Context,
    Added,
    Removed,
    Moved,
    MovedRemoval,
};

std::string
repr(LineClass line_class);

struct ClassifiedLine {
    DiffLine line;
    LineClass line_class;
};

struct ClassifiedHunk {
    std::string old_path;
    std::string new_path;
    std::vector<ClassifiedLine> lines;

    // Every change of the hunk belongs to a move.
    bool
    is_moved() const;
};

std::vector<ClassifiedHunk>
classify_lines(const GitDiff& diff, const MoveReport& report);

}  // namespace effdiff
