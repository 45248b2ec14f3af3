#include "region_rediff.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>

using namespace effdiff;

namespace {

std::string
join(const std::vector<Line>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line.line;
        text += '\n';
    }
    return text;
}

// The original hunks must describe the supplied file contents.
bool
cross_check(const FileDiff& file,
            const std::vector<Line>& old_file,
            const std::vector<Line>& new_file,
            std::string& error) {
    auto matches = [](const std::vector<Line>& lines, int64_t n, const std::string& content) {
        return n >= 1 && n <= static_cast<int64_t>(lines.size()) && lines[static_cast<size_t>(n - 1)].line == content;
    };

    for (const auto& hunk : file.hunks) {
        for (const auto& line : hunk.lines) {
            if (line.old_line_number && !matches(old_file, *line.old_line_number, line.content)) {
                error = fmt::format("old line {} does not match the old file contents", *line.old_line_number);
                return false;
            }
            if (line.new_line_number && !matches(new_file, *line.new_line_number, line.content)) {
                error = fmt::format("new line {} does not match the new file contents", *line.new_line_number);
                return false;
            }
        }
    }
    return true;
}

void
select_lines(const std::vector<Line>& file,
             int64_t begin,
             int64_t end,
             const std::set<int64_t>& moved,
             std::vector<Line>& residual) {
    for (auto n = begin; n < end; n++) {
        if (moved.count(n) == 0) {
            residual.push_back(file[static_cast<size_t>(n - 1)]);
        }
    }
}

}  // namespace

std::string
effdiff::repr(FilePairStatus status) {
    switch (status) {
        case FilePairStatus::kOk:
            return "ok";
        case FilePairStatus::kMissingContent:
            return "missing content";
        case FilePairStatus::kContentMismatch:
            return "content mismatch";
        case FilePairStatus::kRediffFailed:
            return "rediff failed";
        case FilePairStatus::kOutOfRange:
            return "rediff out of range";
    }
    return "unknown";
}

std::vector<Region>
effdiff::residual_regions(const FileDiff& file,
                          int64_t old_line_count,
                          int64_t new_line_count,
                          int64_t context_window) {
    std::vector<Region> regions;
    for (const auto& hunk : file.hunks) {
        Region r;
        r.old_begin = std::max<int64_t>(1, hunk_old_begin(hunk) - context_window);
        r.old_end = std::max(r.old_begin, std::min(old_line_count + 1, hunk_old_end(hunk) + context_window));
        r.new_begin = std::max<int64_t>(1, hunk_new_begin(hunk) - context_window);
        r.new_end = std::max(r.new_begin, std::min(new_line_count + 1, hunk_new_end(hunk) + context_window));

        // Overlapping or touching regions merge.
        if (!regions.empty() && (r.old_begin <= regions.back().old_end || r.new_begin <= regions.back().new_end)) {
            auto& last = regions.back();
            last.old_end = std::max(last.old_end, r.old_end);
            last.new_end = std::max(last.new_end, r.new_end);
        } else {
            regions.push_back(r);
        }
    }
    return regions;
}

std::string
ResidualRegion::old_text() const {
    return join(old_lines);
}

std::string
ResidualRegion::new_text() const {
    return join(new_lines);
}

ResidualRegion
effdiff::build_residual(const Region& region,
                        const std::vector<Line>& old_file,
                        const std::vector<Line>& new_file,
                        const std::set<int64_t>& moved_old,
                        const std::set<int64_t>& moved_new) {
    ResidualRegion residual;
    residual.region = region;
    select_lines(old_file, region.old_begin, region.old_end, moved_old, residual.old_lines);
    select_lines(new_file, region.new_begin, region.new_end, moved_new, residual.new_lines);
    return residual;
}

bool
effdiff::remap_residual_hunks(const ResidualRegion& residual,
                              const std::vector<Hunk>& hunks,
                              std::vector<PositionedLine>& lines,
                              std::string& error) {
    const auto old_size = static_cast<int64_t>(residual.old_lines.size());
    const auto new_size = static_cast<int64_t>(residual.new_lines.size());

    // Absolute position of a residual cursor; past the end maps to the end
    // of the region.
    auto old_abs = [&](int64_t k) {
        return k <= old_size ? residual.old_lines[static_cast<size_t>(k - 1)].line_number : residual.region.old_end;
    };
    auto new_abs = [&](int64_t k) {
        return k <= new_size ? residual.new_lines[static_cast<size_t>(k - 1)].line_number : residual.region.new_end;
    };

    for (const auto& hunk : hunks) {
        int64_t old_cursor = hunk_old_begin(hunk);
        int64_t new_cursor = hunk_new_begin(hunk);
        if (old_cursor < 1 || new_cursor < 1) {
            error = fmt::format("hunk -{},{} +{},{} starts before the region", hunk.old_start, hunk.old_count,
                                hunk.new_start, hunk.new_count);
            return false;
        }

        for (const auto& line : hunk.lines) {
            const bool has_old = line.status != LineStatus::Added;
            const bool has_new = line.status != LineStatus::Removed;

            if ((has_old && old_cursor > old_size) || (has_new && new_cursor > new_size)) {
                error = fmt::format("{} line '{}' lies outside the region", repr(line.status), line.content);
                return false;
            }
            if ((has_old && residual.old_lines[static_cast<size_t>(old_cursor - 1)].line != line.content) ||
                (has_new && residual.new_lines[static_cast<size_t>(new_cursor - 1)].line != line.content)) {
                error = fmt::format("{} line '{}' does not match the region text", repr(line.status), line.content);
                return false;
            }

            PositionedLine pl{line, old_abs(old_cursor), new_abs(new_cursor)};
            pl.line.old_line_number.reset();
            pl.line.new_line_number.reset();
            if (has_old) {
                pl.line.old_line_number = pl.old_pos;
                old_cursor++;
            }
            if (has_new) {
                pl.line.new_line_number = pl.new_pos;
                new_cursor++;
            }
            lines.push_back(std::move(pl));
        }
    }

    return true;
}

FilePairResult
effdiff::rediff_file_pair(const FileDiff& file,
                          const FileContentProvider& contents,
                          const Rediff& rediff,
                          const std::set<int64_t>& moved_old,
                          const std::set<int64_t>& moved_new,
                          const EngineOptions& options) {
    FilePairResult result;
    auto fail = [&result](FilePairStatus status, std::string error) {
        result.status = status;
        result.error = std::move(error);
        result.hunks.clear();
        return result;
    };

    std::string old_text, new_text;
    if (auto status = contents.content(file.old_path, Revision::Old, old_text); status != ReadStatus::kOk) {
        return fail(FilePairStatus::kMissingContent,
                    fmt::format("old revision of '{}': {}", file.old_path, to_string(status)));
    }
    if (auto status = contents.content(file.new_path, Revision::New, new_text); status != ReadStatus::kOk) {
        return fail(FilePairStatus::kMissingContent,
                    fmt::format("new revision of '{}': {}", file.new_path, to_string(status)));
    }

    std::vector<Line> old_file, new_file;
    parselines(old_text, old_file);
    parselines(new_text, new_file);

    std::string error;
    if (!cross_check(file, old_file, new_file, error)) {
        return fail(FilePairStatus::kContentMismatch, error);
    }

    std::vector<PositionedLine> lines;
    for (const auto& region : residual_regions(file, static_cast<int64_t>(old_file.size()),
                                               static_cast<int64_t>(new_file.size()), options.context_window)) {
        auto residual = build_residual(region, old_file, new_file, moved_old, moved_new);

        RediffResult rediff_result;
        try {
            rediff_result = rediff.rediff(residual.old_text(), residual.new_text());
        } catch (const std::exception& e) {
            return fail(FilePairStatus::kRediffFailed, fmt::format("rediff threw: {}", e.what()));
        }
        if (!rediff_result.is_ok()) {
            return fail(FilePairStatus::kRediffFailed, rediff_result.error);
        }

        if (!remap_residual_hunks(residual, rediff_result.hunks, lines, error)) {
            return fail(FilePairStatus::kOutOfRange, error);
        }
    }
    result.hunks = rebuild_hunks(lines);

    // The re-diff may align lines differently than the original diff did.
    // Only the original changes minus the moved lines may survive.
    ChangedLineSet expected;
    for (const auto& key : changed_lines(file.hunks)) {
        const auto& moved = key.first == LineStatus::Removed ? moved_old : moved_new;
        if (moved.count(key.second) == 0) {
            expected.insert(key);
        }
    }
    if (changed_lines(result.hunks) != expected) {
        result.hunks = filter_moved_lines(file, moved_old, moved_new).hunks;
        result.reconciled = true;
    }

    return result;
}
