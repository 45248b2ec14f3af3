#include "block_aggregator.hpp"

#include <map>
#include <queue>
#include <string_view>
#include <tuple>

using namespace effdiff;

namespace {

struct Block {
    LineKey source;
    LineKey target;
    int64_t length;
};

// Longest first, then by source and target position.
bool
precedes(const Block& a, const Block& b) {
    if (a.length != b.length) {
        return a.length > b.length;
    }
    return std::tie(a.source, a.target) < std::tie(b.source, b.target);
}

struct BlockOrder {
    bool
    operator()(const Block& a, const Block& b) const {
        return precedes(b, a);
    }
};

using BlockQueue = std::priority_queue<Block, std::vector<Block>, BlockOrder>;

LineKey
offset(const LineKey& key, int64_t delta) {
    return {key.file, key.line_number + delta};
}

std::string_view
trim(std::string_view s) {
    const char* whitespace = " \t\r\n\v\f";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

struct LineLookup {
    const ExtractedLines& lines;
    std::map<LineKey, size_t> removed_at;
    std::map<LineKey, size_t> added_at;

    explicit LineLookup(const ExtractedLines& extracted) : lines(extracted) {
        for (size_t i = 0; i < lines.removed.size(); i++) {
            removed_at.emplace(lines.removed[i].key, i);
        }
        for (size_t i = 0; i < lines.added.size(); i++) {
            added_at.emplace(lines.added[i].key, i);
        }
    }

    // True if both lines exist and carry the same content.
    bool
    pairs(const LineKey& source, const LineKey& target) const {
        auto r = removed_at.find(source);
        auto a = added_at.find(target);
        if (r == removed_at.end() || a == added_at.end()) {
            return false;
        }
        return lines.removed[r->second].content == lines.added[a->second].content;
    }

    const std::string&
    source_content(const LineKey& source) const {
        return lines.removed[removed_at.at(source)].content;
    }
};

// Seed every diagonal at its first pair and extend it forward. Seeds inside
// a diagonal would only rediscover a suffix of the same block. Diagonals
// shorter than the minimum block size are never queued.
void
find_blocks(const LineLookup& lookup, const LineMatches& matches, const EngineOptions& options, BlockQueue& queue) {
    const auto& removed = lookup.lines.removed;
    const auto& added = lookup.lines.added;

    for (size_t r = 0; r < removed.size(); r++) {
        for (size_t a : matches.matches[r]) {
            const LineKey& source = removed[r].key;
            const LineKey& target = added[a].key;
            if (lookup.pairs(offset(source, -1), offset(target, -1))) {
                continue;
            }

            int64_t length = 1;
            while (lookup.pairs(offset(source, length), offset(target, length))) {
                length++;
            }
            if (length < options.min_block_size) {
                continue;
            }
            queue.push({source, target, length});
        }
    }
}

bool
is_free(const Block& block, int64_t i, const ConsumedLines& consumed) {
    return consumed.removed.count(offset(block.source, i)) == 0 && consumed.added.count(offset(block.target, i)) == 0;
}

// Maximal runs of the block where neither side has been consumed.
std::vector<Block>
free_runs(const Block& block, const ConsumedLines& consumed) {
    std::vector<Block> runs;
    int64_t run_start = -1;
    for (int64_t i = 0; i <= block.length; i++) {
        const bool free = i < block.length && is_free(block, i, consumed);
        if (free && run_start < 0) {
            run_start = i;
        } else if (!free && run_start >= 0) {
            runs.push_back({offset(block.source, run_start), offset(block.target, run_start), i - run_start});
            run_start = -1;
        }
    }
    return runs;
}

void
consume(const Block& block, ConsumedLines& consumed) {
    for (int64_t i = 0; i < block.length; i++) {
        consumed.removed.insert(offset(block.source, i));
        consumed.added.insert(offset(block.target, i));
    }
}

}  // namespace

double
effdiff::move_score(int64_t matched_line_count, double mean_uniqueness) {
    return static_cast<double>(matched_line_count) * mean_uniqueness;
}

bool
effdiff::is_significant_block(const std::vector<std::string>& contents, const EngineOptions& options) {
    int64_t significant = 0;
    for (const auto& content : contents) {
        if (static_cast<int64_t>(trim(content).size()) >= options.min_significant_length) {
            significant++;
        }
    }
    return significant >= options.min_significant_lines;
}

std::vector<MoveCandidate>
effdiff::aggregate_blocks(const ExtractedLines& lines, const LineMatches& matches, const EngineOptions& options) {
    LineLookup lookup{lines};

    BlockQueue queue;
    find_blocks(lookup, matches, options, queue);

    std::vector<MoveCandidate> candidates;
    ConsumedLines consumed;

    while (!queue.empty()) {
        Block block = queue.top();
        queue.pop();

        // Everything left in the queue is at most this long.
        if (block.length < options.min_block_size) {
            break;
        }

        auto runs = free_runs(block, consumed);
        if (runs.size() != 1 || runs[0].length != block.length) {
            for (const auto& run : runs) {
                if (run.length >= options.min_block_size) {
                    queue.push(run);
                }
            }
            continue;
        }

        std::vector<std::string> contents;
        double uniqueness = 0.0;
        for (int64_t i = 0; i < block.length; i++) {
            const auto& content = lookup.source_content(offset(block.source, i));
            uniqueness += 1.0 / static_cast<double>(matches.added_count(content));
            contents.push_back(content);
        }

        if (!is_significant_block(contents, options)) {
            continue;
        }

        consume(block, consumed);

        MoveCandidate candidate;
        candidate.source_file = block.source.file;
        candidate.source_range = {block.source.line_number, block.source.line_number + block.length - 1};
        candidate.target_file = block.target.file;
        candidate.target_range = {block.target.line_number, block.target.line_number + block.length - 1};
        candidate.matched_line_count = block.length;
        candidate.score = move_score(block.length, uniqueness / static_cast<double>(block.length));
        candidates.push_back(std::move(candidate));
    }

    return candidates;
}
