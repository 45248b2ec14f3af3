#include "line_classification.hpp"

using namespace effdiff;

namespace {

bool
in_any(const std::vector<MoveReportEntry>& moves, const std::string& path, int64_t line_number, bool source) {
    for (const auto& move : moves) {
        const auto& file = source ? move.source_file : move.target_file;
        const auto& range = source ? move.source_range : move.target_range;
        if (file == path && range.contains(line_number)) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string
effdiff::repr(LineClass line_class) {
    switch (line_class) {
        case LineClass::Context:
            return "context";
        case LineClass::Added:
            return "added";
        case LineClass::Removed:
            return "removed";
        case LineClass::Moved:
            return "moved";
        case LineClass::MovedRemoval:
            return "moved_removal";
    }
    return "unknown";
}

bool
ClassifiedHunk::is_moved() const {
    bool any_change = false;
    for (const auto& l : lines) {
        if (l.line_class == LineClass::Added || l.line_class == LineClass::Removed) {
            return false;
        }
        any_change = any_change || l.line_class != LineClass::Context;
    }
    return any_change;
}

std::vector<ClassifiedHunk>
effdiff::classify_lines(const GitDiff& diff, const MoveReport& report) {
    std::vector<ClassifiedHunk> hunks;
    for (const auto& file : diff.files) {
        for (const auto& hunk : file.hunks) {
            ClassifiedHunk classified{file.old_path, file.new_path, {}};
            for (const auto& line : hunk.lines) {
                LineClass line_class = LineClass::Context;
                switch (line.status) {
                    case LineStatus::Context:
                        break;
                    case LineStatus::Added:
                        line_class = in_any(report.moves, file.new_path, *line.new_line_number, false)
                                         ? LineClass::Moved
                                         : LineClass::Added;
                        break;
                    case LineStatus::Removed:
                        line_class = in_any(report.moves, file.old_path, *line.old_line_number, true)
                                         ? LineClass::MovedRemoval
                                         : LineClass::Removed;
                        break;
                }
                classified.lines.push_back({line, line_class});
            }
            hunks.push_back(std::move(classified));
        }
    }
    return hunks;
}
