#include "move_report.hpp"

#include <algorithm>
#include <tuple>

using namespace effdiff;

namespace {

// Changed lines of the file pair whose new path is `path`, placed on the new
// side; removed lines count at the new line they precede.
int64_t
count_changes_near(const GitDiff& diff, const std::string& path, int64_t first, int64_t last) {
    int64_t count = 0;
    for (const auto& file : diff.files) {
        if (file.new_path != path) {
            continue;
        }
        for (const auto& hunk : file.hunks) {
            int64_t new_pos = hunk_new_begin(hunk);
            for (const auto& line : hunk.lines) {
                if (line.is_change() && new_pos >= first && new_pos <= last) {
                    count++;
                }
                if (line.status != LineStatus::Removed) {
                    new_pos++;
                }
            }
        }
    }
    return count;
}

}  // namespace

MoveReport
effdiff::build_move_report(const std::vector<MoveCandidate>& candidates,
                           const GitDiff& effective_diff,
                           int64_t context_window) {
    MoveReport report;

    for (const auto& c : candidates) {
        MoveReportEntry entry;
        entry.source_file = c.source_file;
        entry.source_range = c.source_range;
        entry.target_file = c.target_file;
        entry.target_range = c.target_range;
        entry.matched_line_count = c.matched_line_count;
        entry.score = c.score;
        entry.effective_diff_lines =
            count_changes_near(effective_diff, c.target_file, c.target_range.start - context_window,
                               c.target_range.end + context_window);
        report.total_lines_moved += c.matched_line_count;
        report.moves.push_back(std::move(entry));
    }

    std::sort(report.moves.begin(), report.moves.end(), [](const MoveReportEntry& a, const MoveReportEntry& b) {
        return std::tie(a.source_file, a.source_range.start, a.target_file, a.target_range.start) <
               std::tie(b.source_file, b.source_range.start, b.target_file, b.target_range.start);
    });

    report.total_lines_effectively_changed = effective_diff.changed_line_count();
    return report;
}
