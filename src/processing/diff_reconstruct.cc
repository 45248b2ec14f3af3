#include "diff_reconstruct.hpp"

#include <fmt/format.h>

#include <tuple>

using namespace effdiff;

namespace {

const std::set<int64_t> kNoLines;

bool
has_old_side(const DiffLine& line) {
    return line.status != LineStatus::Added;
}

bool
has_new_side(const DiffLine& line) {
    return line.status != LineStatus::Removed;
}

bool
has_change(const Hunk& hunk) {
    for (const auto& line : hunk.lines) {
        if (line.is_change()) {
            return true;
        }
    }
    return false;
}

using SideKey = std::tuple<LineStatus, std::string, int64_t>;

std::string
describe(const SideKey& key) {
    return fmt::format("{} line {}:{}", repr(std::get<0>(key)), std::get<1>(key), std::get<2>(key));
}

}  // namespace

MovedLines
MovedLines::from_candidates(const std::vector<MoveCandidate>& candidates) {
    MovedLines moved;
    for (const auto& c : candidates) {
        auto& old_lines = moved.old_lines[c.source_file];
        for (auto n = c.source_range.start; n <= c.source_range.end; n++) {
            old_lines.insert(n);
        }
        auto& new_lines = moved.new_lines[c.target_file];
        for (auto n = c.target_range.start; n <= c.target_range.end; n++) {
            new_lines.insert(n);
        }
    }
    return moved;
}

const std::set<int64_t>&
MovedLines::old_lines_of(const std::string& path) const {
    auto it = old_lines.find(path);
    return it == old_lines.end() ? kNoLines : it->second;
}

const std::set<int64_t>&
MovedLines::new_lines_of(const std::string& path) const {
    auto it = new_lines.find(path);
    return it == new_lines.end() ? kNoLines : it->second;
}

bool
MovedLines::touches(const FileDiff& file) const {
    return (!file.is_created() && !old_lines_of(file.old_path).empty()) ||
           (!file.is_deleted() && !new_lines_of(file.new_path).empty());
}

std::vector<PositionedLine>
effdiff::position_lines(const Hunk& hunk) {
    std::vector<PositionedLine> lines;
    int64_t old_pos = hunk_old_begin(hunk);
    int64_t new_pos = hunk_new_begin(hunk);
    for (const auto& line : hunk.lines) {
        lines.push_back({line, old_pos, new_pos});
        if (has_old_side(line)) {
            old_pos++;
        }
        if (has_new_side(line)) {
            new_pos++;
        }
    }
    return lines;
}

std::vector<Hunk>
effdiff::rebuild_hunks(const std::vector<PositionedLine>& lines) {
    std::vector<Hunk> hunks;

    Hunk current;
    bool open = false;
    int64_t old_begin = 0, new_begin = 0;
    int64_t next_old = 0, next_new = 0;

    auto flush = [&]() {
        if (open && has_change(current)) {
            current.old_start = current.old_count > 0 ? old_begin : old_begin - 1;
            current.new_start = current.new_count > 0 ? new_begin : new_begin - 1;
            hunks.push_back(std::move(current));
        }
        current = Hunk{};
        open = false;
    };

    for (const auto& pl : lines) {
        if (open && (pl.old_pos != next_old || pl.new_pos != next_new)) {
            flush();
        }
        if (!open) {
            open = true;
            old_begin = pl.old_pos;
            new_begin = pl.new_pos;
        }

        current.lines.push_back(pl.line);
        next_old = pl.old_pos;
        next_new = pl.new_pos;
        if (has_old_side(pl.line)) {
            current.old_count++;
            next_old++;
        }
        if (has_new_side(pl.line)) {
            current.new_count++;
            next_new++;
        }
    }
    flush();

    return hunks;
}

FileDiff
effdiff::filter_moved_lines(const FileDiff& file,
                            const std::set<int64_t>& moved_old,
                            const std::set<int64_t>& moved_new) {
    std::vector<PositionedLine> kept;
    for (const auto& hunk : file.hunks) {
        for (auto& pl : position_lines(hunk)) {
            const auto& line = pl.line;
            if (line.status == LineStatus::Removed && moved_old.count(*line.old_line_number)) {
                continue;
            }
            if (line.status == LineStatus::Added && moved_new.count(*line.new_line_number)) {
                continue;
            }
            kept.push_back(std::move(pl));
        }
    }
    return FileDiff{file.old_path, file.new_path, rebuild_hunks(kept)};
}

ChangedLineSet
effdiff::changed_lines(const std::vector<Hunk>& hunks) {
    ChangedLineSet changed;
    for (const auto& hunk : hunks) {
        for (const auto& line : hunk.lines) {
            if (line.status == LineStatus::Removed) {
                changed.insert({line.status, *line.old_line_number});
            } else if (line.status == LineStatus::Added) {
                changed.insert({line.status, *line.new_line_number});
            }
        }
    }
    return changed;
}

PartitionResult
effdiff::verify_partition(const GitDiff& original,
                          const GitDiff& effective,
                          const std::vector<MoveCandidate>& moves) {
    auto collect = [](const GitDiff& diff, std::set<SideKey>& keys) -> std::string {
        for (const auto& file : diff.files) {
            for (const auto& hunk : file.hunks) {
                for (const auto& line : hunk.lines) {
                    if (!line.is_change()) {
                        continue;
                    }
                    SideKey key = line.status == LineStatus::Removed
                                      ? SideKey{line.status, file.old_path, *line.old_line_number}
                                      : SideKey{line.status, file.new_path, *line.new_line_number};
                    if (!keys.insert(key).second) {
                        return fmt::format("{} appears twice", describe(key));
                    }
                }
            }
        }
        return {};
    };

    PartitionResult result;
    auto fail = [&result](std::string error) {
        result.ok = false;
        result.error = std::move(error);
        return result;
    };

    std::set<SideKey> expected;
    if (auto error = collect(original, expected); !error.empty()) {
        return fail(error);
    }

    std::set<SideKey> accounted;
    if (auto error = collect(effective, accounted); !error.empty()) {
        return fail(error);
    }
    for (const auto& key : accounted) {
        if (expected.count(key) == 0) {
            return fail(fmt::format("{} is not part of the original diff", describe(key)));
        }
    }

    auto claim = [&](const SideKey& key) -> std::string {
        if (expected.count(key) == 0) {
            return fmt::format("moved {} is not part of the original diff", describe(key));
        }
        if (!accounted.insert(key).second) {
            return fmt::format("{} is both moved and retained, or moved twice", describe(key));
        }
        return {};
    };
    for (const auto& move : moves) {
        for (auto n = move.source_range.start; n <= move.source_range.end; n++) {
            if (auto error = claim({LineStatus::Removed, move.source_file, n}); !error.empty()) {
                return fail(error);
            }
        }
        for (auto n = move.target_range.start; n <= move.target_range.end; n++) {
            if (auto error = claim({LineStatus::Added, move.target_file, n}); !error.empty()) {
                return fail(error);
            }
        }
    }

    if (accounted.size() != expected.size()) {
        for (const auto& key : expected) {
            if (accounted.count(key) == 0) {
                return fail(fmt::format("{} was lost", describe(key)));
            }
        }
    }

    return result;
}
