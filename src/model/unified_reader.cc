#include "unified_reader.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <charconv>
#include <string_view>

using namespace effdiff;

namespace {

bool
starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// "--- a/src/x.cc\t2024-01-01" -> "src/x.cc"
std::string
header_path(std::string_view text, std::string_view side_prefix) {
    auto tab = text.find('\t');
    if (tab != std::string_view::npos) {
        text = text.substr(0, tab);
    }
    if (text == kNullPath) {
        return kNullPath;
    }
    if (starts_with(text, side_prefix)) {
        text.remove_prefix(side_prefix.size());
    }
    return std::string{text};
}

bool
parse_number(std::string_view& s, int64_t& value) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr == s.data()) {
        return false;
    }
    s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
    return true;
}

// "-12,3" or "-12"; a missing count means one line.
bool
parse_range(std::string_view& s, char sign, int64_t& start, int64_t& count) {
    if (s.empty() || s[0] != sign) {
        return false;
    }
    s.remove_prefix(1);
    if (!parse_number(s, start)) {
        return false;
    }
    count = 1;
    if (!s.empty() && s[0] == ',') {
        s.remove_prefix(1);
        if (!parse_number(s, count)) {
            return false;
        }
    }
    return true;
}

bool
parse_hunk_header(std::string_view line, Hunk& hunk) {
    if (!starts_with(line, "@@ ")) {
        return false;
    }
    line.remove_prefix(3);
    if (!parse_range(line, '-', hunk.old_start, hunk.old_count)) {
        return false;
    }
    if (!starts_with(line, " ")) {
        return false;
    }
    line.remove_prefix(1);
    if (!parse_range(line, '+', hunk.new_start, hunk.new_count)) {
        return false;
    }
    return starts_with(line, " @@");
}

struct ReaderState {
    GitDiff& diff;
    FileDiff* file = nullptr;
    Hunk* hunk = nullptr;

    int64_t old_remaining = 0;
    int64_t new_remaining = 0;
    int64_t old_cursor = 0;
    int64_t new_cursor = 0;

    // Set after a "diff --git" line until the ---/+++ pair has been seen.
    bool expect_headers = false;

    bool
    in_hunk_body() const {
        return hunk != nullptr && (old_remaining > 0 || new_remaining > 0);
    }

    FileDiff&
    start_file(std::string old_path, std::string new_path) {
        diff.files.push_back({std::move(old_path), std::move(new_path), {}});
        file = &diff.files.back();
        hunk = nullptr;
        return *file;
    }
};

}  // namespace

bool
effdiff::parse_unified_diff(const std::string& diff_text,
                            const std::string& commit_hash,
                            GitDiff& result_diff,
                            DiffParseResult& result) {
    result_diff = GitDiff{};
    result_diff.commit_hash = commit_hash;
    result = DiffParseResult{};

    std::vector<Line> lines;
    parselines(diff_text, lines);

    ReaderState s{result_diff};

    auto set_error = [&](DiffParseErrorKind kind, int64_t line_number, std::string message) {
        result.kind = kind;
        result.line = line_number;
        result.error = fmt::format("line {}: {}", line_number, message);
        return false;
    };

    for (const auto& l : lines) {
        std::string_view text = l.line;

        if (s.in_hunk_body()) {
            if (starts_with(text, "\\")) {
                // "\ No newline at end of file"
                continue;
            }
            const char op = text.empty() ? ' ' : text[0];
            std::string content = text.empty() ? std::string{} : std::string{text.substr(1)};
            switch (op) {
                case ' ':
                    if (s.old_remaining == 0 || s.new_remaining == 0) {
                        return set_error(DiffParseErrorKind::UnknownLine, l.line_number,
                                         "context line exceeds hunk size");
                    }
                    s.hunk->lines.push_back(DiffLine::context(std::move(content), s.old_cursor++, s.new_cursor++));
                    s.old_remaining--;
                    s.new_remaining--;
                    break;
                case '-':
                    if (s.old_remaining == 0) {
                        return set_error(DiffParseErrorKind::UnknownLine, l.line_number,
                                         "removed line exceeds hunk size");
                    }
                    s.hunk->lines.push_back(DiffLine::removed(std::move(content), s.old_cursor++));
                    s.old_remaining--;
                    break;
                case '+':
                    if (s.new_remaining == 0) {
                        return set_error(DiffParseErrorKind::UnknownLine, l.line_number,
                                         "added line exceeds hunk size");
                    }
                    s.hunk->lines.push_back(DiffLine::added(std::move(content), s.new_cursor++));
                    s.new_remaining--;
                    break;
                default:
                    return set_error(DiffParseErrorKind::UnknownLine, l.line_number,
                                     fmt::format("unexpected line '{}' inside hunk", text));
            }
            continue;
        }

        if (starts_with(text, "diff --git ")) {
            std::string_view rest = text.substr(11);
            auto split = rest.rfind(" b/");
            std::string old_path, new_path;
            if (split != std::string_view::npos) {
                old_path = header_path(rest.substr(0, split), "a/");
                new_path = header_path(rest.substr(split + 1), "b/");
            }
            s.start_file(std::move(old_path), std::move(new_path));
            s.expect_headers = true;
        } else if (starts_with(text, "new file mode") && s.file) {
            s.file->old_path = kNullPath;
        } else if (starts_with(text, "deleted file mode") && s.file) {
            s.file->new_path = kNullPath;
        } else if (starts_with(text, "rename from ") && s.file) {
            s.file->old_path = std::string{text.substr(12)};
        } else if (starts_with(text, "rename to ") && s.file) {
            s.file->new_path = std::string{text.substr(10)};
        } else if (starts_with(text, "--- ")) {
            // A bare unified diff has no "diff --git" line; the header pair opens the file.
            if (!s.file || !s.expect_headers) {
                s.start_file({}, {});
            }
            s.file->old_path = header_path(text.substr(4), "a/");
            s.expect_headers = true;
        } else if (starts_with(text, "+++ ") && s.file) {
            s.file->new_path = header_path(text.substr(4), "b/");
            s.expect_headers = false;
        } else if (starts_with(text, "@@")) {
            if (!s.file) {
                return set_error(DiffParseErrorKind::Orphan, l.line_number, "hunk before any file header");
            }
            Hunk hunk;
            if (!parse_hunk_header(text, hunk)) {
                return set_error(DiffParseErrorKind::HunkHeader, l.line_number,
                                 fmt::format("malformed hunk header '{}'", text));
            }
            s.expect_headers = false;
            s.file->hunks.push_back(std::move(hunk));
            s.hunk = &s.file->hunks.back();
            s.old_remaining = s.hunk->old_count;
            s.new_remaining = s.hunk->new_count;
            s.old_cursor = hunk_old_begin(*s.hunk);
            s.new_cursor = hunk_new_begin(*s.hunk);
        }
        // Anything else is metadata (index, mode, similarity, binary notices).
    }

    if (s.in_hunk_body()) {
        return set_error(DiffParseErrorKind::Truncated, static_cast<int64_t>(lines.size()),
                         "input ended inside a hunk");
    }

    return true;
}
