#include "line_matcher.hpp"

using namespace effdiff;

size_t
LineMatches::added_count(const std::string& content) const {
    auto it = added_by_content.find(content);
    return it == added_by_content.end() ? 0 : it->second.size();
}

LineMatches
effdiff::match_lines(const std::vector<ExtractedLine>& removed, const std::vector<ExtractedLine>& added) {
    LineMatches result;

    for (size_t i = 0; i < added.size(); i++) {
        result.added_by_content[added[i].content].push_back(i);
    }

    result.matches.reserve(removed.size());
    for (const auto& line : removed) {
        auto it = result.added_by_content.find(line.content);
        if (it == result.added_by_content.end()) {
            result.matches.emplace_back();
        } else {
            result.matches.push_back(it->second);
        }
    }

    return result;
}
