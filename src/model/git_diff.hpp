#pragma once

/*
    The diff model: a set of file pairs, each an ordered list of hunks made
    of tagged and numbered lines.

    Line numbers are 1-based. A hunk side with a count of zero follows the
    unified diff convention; the start names the line after which the change
    applies.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace effdiff {

using std::int64_t;
using std::size_t;

const std::string kNullPath = "/dev/null";

enum class LineStatus {
    Context,
    Added,
    Removed,
};

std::string
repr(LineStatus status);

struct DiffLine {
    LineStatus status = LineStatus::Context;
    std::string content;
    std::optional<int64_t> old_line_number;
    std::optional<int64_t> new_line_number;

    static DiffLine
    context(std::string content, int64_t old_line_number, int64_t new_line_number) {
        return {LineStatus::Context, std::move(content), old_line_number, new_line_number};
    }

    static DiffLine
    added(std::string content, int64_t new_line_number) {
        return {LineStatus::Added, std::move(content), std::nullopt, new_line_number};
    }

    static DiffLine
    removed(std::string content, int64_t old_line_number) {
        return {LineStatus::Removed, std::move(content), old_line_number, std::nullopt};
    }

    bool
    is_change() const {
        return status != LineStatus::Context;
    }

    bool
    operator==(const DiffLine& other) const {
        return status == other.status && content == other.content &&
               old_line_number == other.old_line_number && new_line_number == other.new_line_number;
    }

    bool
    operator!=(const DiffLine& other) const {
        return !(*this == other);
    }
};

struct Hunk {
    int64_t old_start = 0;
    int64_t old_count = 0;
    int64_t new_start = 0;
    int64_t new_count = 0;

    std::vector<DiffLine> lines;

    bool
    operator==(const Hunk& other) const {
        return old_start == other.old_start && old_count == other.old_count &&
               new_start == other.new_start && new_count == other.new_count && lines == other.lines;
    }

    bool
    operator!=(const Hunk& other) const {
        return !(*this == other);
    }
};

// First line covered on a side, and one past the last. Zero count sides
// yield an empty range positioned after `start`.
int64_t
hunk_old_begin(const Hunk& hunk);
int64_t
hunk_old_end(const Hunk& hunk);
int64_t
hunk_new_begin(const Hunk& hunk);
int64_t
hunk_new_end(const Hunk& hunk);

struct FileDiff {
    std::string old_path;
    std::string new_path;

    std::vector<Hunk> hunks;

    bool
    is_created() const {
        return old_path == kNullPath;
    }

    bool
    is_deleted() const {
        return new_path == kNullPath;
    }

    // The path the file pair is known by; the new path unless the file was deleted.
    const std::string&
    path() const {
        return is_deleted() ? old_path : new_path;
    }

    bool
    operator==(const FileDiff& other) const {
        return old_path == other.old_path && new_path == other.new_path && hunks == other.hunks;
    }

    bool
    operator!=(const FileDiff& other) const {
        return !(*this == other);
    }
};

struct GitDiff {
    std::vector<FileDiff> files;
    std::string commit_hash;

    bool
    empty() const;

    // Number of added and removed lines over all files.
    int64_t
    changed_line_count() const;

    bool
    operator==(const GitDiff& other) const {
        return commit_hash == other.commit_hash && files == other.files;
    }

    bool
    operator!=(const GitDiff& other) const {
        return !(*this == other);
    }
};

enum class ValidationErrorKind {
    None,
    DuplicateFilePair,
    InvalidPath,
    InvertedRange,
    CountMismatch,
    LineNumbering,
    OverlappingHunks,
};

std::string
repr(ValidationErrorKind kind);

struct ValidationResult {
    ValidationErrorKind kind = ValidationErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ValidationErrorKind::None;
    }
};

// Check the structural invariants of a diff: unique file pairs, line tags
// carrying the right numbers, contiguous numbering that agrees with the hunk
// header, and hunks that do not overlap within a file.
ValidationResult
validate_git_diff(const GitDiff& diff);

}  // namespace effdiff
