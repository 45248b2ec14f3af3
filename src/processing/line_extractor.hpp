#pragma once

#include "model/git_diff.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace effdiff {

// A line of one side of a file pair; removed lines are keyed by the old
// path and number, added lines by the new path and number.
struct LineKey {
    std::string file;
    int64_t line_number = 0;

    bool
    operator<(const LineKey& other) const {
        return std::tie(file, line_number) < std::tie(other.file, other.line_number);
    }

    bool
    operator==(const LineKey& other) const {
        return file == other.file && line_number == other.line_number;
    }
};

struct ExtractedLine {
    LineKey key;
    std::string content;
};

struct ExtractedLines {
    std::vector<ExtractedLine> removed;
    std::vector<ExtractedLine> added;
};

ExtractedLines
extract_lines(const GitDiff& diff);

}  // namespace effdiff
