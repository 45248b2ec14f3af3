#pragma once

/*
    Match removed lines to added lines with byte-identical content.

    Added lines are indexed by content once; every removed line is then a
    single lookup. No content is special-cased here. Blank and short lines
    match like any other and are weeded out at the block level.
*/

#include "processing/line_extractor.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace effdiff {

// Positions into ExtractedLines::added, in extraction order.
using AddedLinePositions = std::vector<size_t>;

using ContentIndex = std::unordered_map<std::string, AddedLinePositions>;

struct LineMatches {
    ContentIndex added_by_content;

    // One entry per removed line, parallel to ExtractedLines::removed.
    std::vector<AddedLinePositions> matches;

    // Number of added lines carrying `content`; zero when there are none.
    size_t
    added_count(const std::string& content) const;
};

LineMatches
match_lines(const std::vector<ExtractedLine>& removed, const std::vector<ExtractedLine>& added);

}  // namespace effdiff
