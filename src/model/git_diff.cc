#include "git_diff.hpp"

#include <fmt/format.h>

#include <set>

using namespace effdiff;

namespace {

ValidationResult
fail(ValidationErrorKind kind, std::string error) {
    return {kind, std::move(error)};
}

ValidationResult
validate_hunk(const FileDiff& file, size_t hunk_index, const Hunk& hunk) {
    const std::string where = fmt::format("{} hunk #{}", file.path(), hunk_index + 1);

    if (hunk.old_count < 0 || hunk.new_count < 0 || hunk.old_start < 0 || hunk.new_start < 0) {
        return fail(ValidationErrorKind::InvertedRange,
                    fmt::format("{}: negative range -{},{} +{},{}", where, hunk.old_start, hunk.old_count,
                                hunk.new_start, hunk.new_count));
    }
    if ((hunk.old_count > 0 && hunk.old_start == 0) || (hunk.new_count > 0 && hunk.new_start == 0)) {
        return fail(ValidationErrorKind::InvertedRange, fmt::format("{}: non-empty side starts at line 0", where));
    }

    int64_t expected_old = hunk_old_begin(hunk);
    int64_t expected_new = hunk_new_begin(hunk);
    int64_t old_seen = 0;
    int64_t new_seen = 0;
    for (const auto& line : hunk.lines) {
        const bool has_old = line.old_line_number.has_value();
        const bool has_new = line.new_line_number.has_value();
        const bool wants_old = line.status != LineStatus::Added;
        const bool wants_new = line.status != LineStatus::Removed;
        if (has_old != wants_old || has_new != wants_new) {
            return fail(ValidationErrorKind::LineNumbering,
                        fmt::format("{}: {} line carries the wrong line numbers", where, repr(line.status)));
        }
        if (wants_old) {
            if (*line.old_line_number != expected_old) {
                return fail(ValidationErrorKind::LineNumbering,
                            fmt::format("{}: expected old line {}, found {}", where, expected_old,
                                        *line.old_line_number));
            }
            expected_old++;
            old_seen++;
        }
        if (wants_new) {
            if (*line.new_line_number != expected_new) {
                return fail(ValidationErrorKind::LineNumbering,
                            fmt::format("{}: expected new line {}, found {}", where, expected_new,
                                        *line.new_line_number));
            }
            expected_new++;
            new_seen++;
        }
    }

    if (old_seen != hunk.old_count || new_seen != hunk.new_count) {
        return fail(ValidationErrorKind::CountMismatch,
                    fmt::format("{}: header says -{} +{} lines, body has -{} +{}", where, hunk.old_count,
                                hunk.new_count, old_seen, new_seen));
    }

    return {};
}

}  // namespace

int64_t
effdiff::hunk_old_begin(const Hunk& hunk) {
    return hunk.old_count > 0 ? hunk.old_start : hunk.old_start + 1;
}

int64_t
effdiff::hunk_old_end(const Hunk& hunk) {
    return hunk_old_begin(hunk) + hunk.old_count;
}

int64_t
effdiff::hunk_new_begin(const Hunk& hunk) {
    return hunk.new_count > 0 ? hunk.new_start : hunk.new_start + 1;
}

int64_t
effdiff::hunk_new_end(const Hunk& hunk) {
    return hunk_new_begin(hunk) + hunk.new_count;
}

bool
GitDiff::empty() const {
    for (const auto& file : files) {
        if (!file.hunks.empty()) {
            return false;
        }
    }
    return true;
}

int64_t
GitDiff::changed_line_count() const {
    int64_t count = 0;
    for (const auto& file : files) {
        for (const auto& hunk : file.hunks) {
            for (const auto& line : hunk.lines) {
                if (line.is_change()) {
                    count++;
                }
            }
        }
    }
    return count;
}

std::string
effdiff::repr(LineStatus status) {
    switch (status) {
        case LineStatus::Context:
            return "context";
        case LineStatus::Added:
            return "added";
        case LineStatus::Removed:
            return "removed";
    }
    return "unknown";
}

std::string
effdiff::repr(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::None:
            return "none";
        case ValidationErrorKind::DuplicateFilePair:
            return "duplicate file pair";
        case ValidationErrorKind::InvalidPath:
            return "invalid path";
        case ValidationErrorKind::InvertedRange:
            return "inverted range";
        case ValidationErrorKind::CountMismatch:
            return "count mismatch";
        case ValidationErrorKind::LineNumbering:
            return "line numbering";
        case ValidationErrorKind::OverlappingHunks:
            return "overlapping hunks";
    }
    return "unknown";
}

ValidationResult
effdiff::validate_git_diff(const GitDiff& diff) {
    std::set<std::string> old_paths;
    std::set<std::string> new_paths;

    for (const auto& file : diff.files) {
        if (file.old_path.empty() || file.new_path.empty() || (file.is_created() && file.is_deleted())) {
            return fail(ValidationErrorKind::InvalidPath,
                        fmt::format("invalid file pair '{}' -> '{}'", file.old_path, file.new_path));
        }
        if (!file.is_created() && !old_paths.insert(file.old_path).second) {
            return fail(ValidationErrorKind::DuplicateFilePair,
                        fmt::format("'{}' appears as old path more than once", file.old_path));
        }
        if (!file.is_deleted() && !new_paths.insert(file.new_path).second) {
            return fail(ValidationErrorKind::DuplicateFilePair,
                        fmt::format("'{}' appears as new path more than once", file.new_path));
        }

        for (size_t i = 0; i < file.hunks.size(); i++) {
            const Hunk& hunk = file.hunks[i];
            if (auto result = validate_hunk(file, i, hunk); !result.is_ok()) {
                return result;
            }

            if (file.is_created() && hunk.old_count > 0) {
                return fail(ValidationErrorKind::CountMismatch,
                            fmt::format("{}: created file has removed lines", file.path()));
            }
            if (file.is_deleted() && hunk.new_count > 0) {
                return fail(ValidationErrorKind::CountMismatch,
                            fmt::format("{}: deleted file has added lines", file.path()));
            }

            if (i > 0) {
                const Hunk& prev = file.hunks[i - 1];
                if (hunk_old_begin(hunk) < hunk_old_end(prev) || hunk_new_begin(hunk) < hunk_new_end(prev)) {
                    return fail(ValidationErrorKind::OverlappingHunks,
                                fmt::format("{}: hunk #{} overlaps hunk #{}", file.path(), i + 1, i));
                }
            }
        }
    }

    return {};
}
