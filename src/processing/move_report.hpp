#pragma once

#include "model/git_diff.hpp"
#include "processing/block_aggregator.hpp"

#include <string>
#include <vector>

namespace effdiff {

struct MoveReportEntry {
    std::string source_file;
    LineRange source_range;
    std::string target_file;
    LineRange target_range;
    int64_t matched_line_count = 0;
    double score = 0.0;

    // Changed lines of the effective diff in the target file within the
    // context window around the target range.
    int64_t effective_diff_lines = 0;
};

struct MoveReport {
    std::vector<MoveReportEntry> moves;

    int64_t total_lines_moved = 0;
    int64_t total_lines_effectively_changed = 0;

    int64_t
    moves_detected() const {
        return static_cast<int64_t>(moves.size());
    }

    bool
    empty() const {
        return moves.empty();
    }
};

// Entries are sorted by source file, then source start line.
MoveReport
build_move_report(const std::vector<MoveCandidate>& candidates,
                  const GitDiff& effective_diff,
                  int64_t context_window);

}  // namespace effdiff
