#pragma once

/*
    Re-express hunks at line granularity.

    Every line of a hunk sits at a position on both sides: the number of the
    line itself on the sides it belongs to, and the number of the next line
    on the side it does not. A run of lines forms a valid hunk as long as
    both positions advance without gaps, so dropping a line from the middle
    of a hunk splits it in two.
*/

#include "model/git_diff.hpp"
#include "processing/block_aggregator.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace effdiff {

struct PositionedLine {
    DiffLine line;
    int64_t old_pos = 0;
    int64_t new_pos = 0;
};

// Moved line numbers per path; old numbers keyed by old path, new numbers
// by new path.
struct MovedLines {
    std::map<std::string, std::set<int64_t>> old_lines;
    std::map<std::string, std::set<int64_t>> new_lines;

    static MovedLines
    from_candidates(const std::vector<MoveCandidate>& candidates);

    const std::set<int64_t>&
    old_lines_of(const std::string& path) const;
    const std::set<int64_t>&
    new_lines_of(const std::string& path) const;

    // True if the file pair has a moved line on either side.
    bool
    touches(const FileDiff& file) const;
};

std::vector<PositionedLine>
position_lines(const Hunk& hunk);

// Split wherever the numbering is not contiguous and drop pieces without
// changes.
std::vector<Hunk>
rebuild_hunks(const std::vector<PositionedLine>& lines);

// Remove moved lines from the hunks of `file`, keeping everything else.
FileDiff
filter_moved_lines(const FileDiff& file, const std::set<int64_t>& moved_old, const std::set<int64_t>& moved_new);

// Changed lines of a file pair as (status, line number) pairs.
using ChangedLineSet = std::set<std::pair<LineStatus, int64_t>>;

ChangedLineSet
changed_lines(const std::vector<Hunk>& hunks);

struct PartitionResult {
    bool ok = true;
    std::string error;
};

// Every changed line of `original` must be either inside exactly one move
// or present in `effective`, and `effective` must not add lines of its own.
PartitionResult
verify_partition(const GitDiff& original, const GitDiff& effective, const std::vector<MoveCandidate>& moves);

}  // namespace effdiff
