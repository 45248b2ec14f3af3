#include "line_extractor.hpp"

using namespace effdiff;

ExtractedLines
effdiff::extract_lines(const GitDiff& diff) {
    ExtractedLines lines;
    for (const auto& file : diff.files) {
        for (const auto& hunk : file.hunks) {
            for (const auto& line : hunk.lines) {
                switch (line.status) {
                    case LineStatus::Removed:
                        lines.removed.push_back({{file.old_path, *line.old_line_number}, line.content});
                        break;
                    case LineStatus::Added:
                        lines.added.push_back({{file.new_path, *line.new_line_number}, line.content});
                        break;
                    case LineStatus::Context:
                        break;
                }
            }
        }
    }
    return lines;
}
