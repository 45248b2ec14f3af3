#pragma once

/*
    Grow matched line pairs into move candidates.

    Every pair of a removed and an added line with equal content lies on a
    diagonal: removed line i of one file against added line j of another.
    Runs along a diagonal form maximal blocks. Blocks are selected longest
    first; lines taken by a selected block are consumed, and a block that
    overlaps consumed lines is split into its free sub-runs which compete
    again.
*/

#include "config/config.hpp"
#include "processing/line_extractor.hpp"
#include "processing/line_matcher.hpp"

#include <set>
#include <string>
#include <vector>

namespace effdiff {

// Inclusive range of line numbers.
struct LineRange {
    int64_t start = 0;
    int64_t end = 0;

    int64_t
    length() const {
        return end - start + 1;
    }

    bool
    contains(int64_t line_number) const {
        return line_number >= start && line_number <= end;
    }

    bool
    operator==(const LineRange& other) const {
        return start == other.start && end == other.end;
    }
};

struct MoveCandidate {
    std::string source_file;
    LineRange source_range;
    std::string target_file;
    LineRange target_range;
    int64_t matched_line_count = 0;
    double score = 0.0;
};

// Lines claimed by accepted blocks during one aggregation pass.
struct ConsumedLines {
    std::set<LineKey> removed;
    std::set<LineKey> added;
};

// Uniqueness weighted size of a block. For a fixed mean uniqueness the
// score grows strictly with the matched line count.
double
move_score(int64_t matched_line_count, double mean_uniqueness);

// A block is significant when enough of its lines carry real content.
bool
is_significant_block(const std::vector<std::string>& contents, const EngineOptions& options);

std::vector<MoveCandidate>
aggregate_blocks(const ExtractedLines& lines, const LineMatches& matches, const EngineOptions& options);

}  // namespace effdiff
