#include "json.hpp"

#include <fmt/format.h>

#include <stdexcept>

using namespace effdiff;
using json = nlohmann::json;

namespace {

json
line_number_to_json(const std::optional<int64_t>& line_number) {
    if (line_number) {
        return *line_number;
    }
    return nullptr;
}

std::optional<int64_t>
line_number_from_json(const json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<int64_t>();
}

LineStatus
line_status_from_string(const std::string& status) {
    if (status == "context") {
        return LineStatus::Context;
    }
    if (status == "added") {
        return LineStatus::Added;
    }
    if (status == "removed") {
        return LineStatus::Removed;
    }
    throw std::invalid_argument(fmt::format("unknown line status '{}'", status));
}

json
range_to_json(const LineRange& range) {
    return json::array({range.start, range.end});
}

}  // namespace

void
effdiff::to_json(json& j, const DiffLine& line) {
    j = json{{"status", repr(line.status)},
             {"content", line.content},
             {"old_line", line_number_to_json(line.old_line_number)},
             {"new_line", line_number_to_json(line.new_line_number)}};
}

void
effdiff::from_json(const json& j, DiffLine& line) {
    line.status = line_status_from_string(j.at("status").get<std::string>());
    line.content = j.at("content").get<std::string>();
    line.old_line_number = line_number_from_json(j.value("old_line", json{}));
    line.new_line_number = line_number_from_json(j.value("new_line", json{}));
}

void
effdiff::to_json(json& j, const Hunk& hunk) {
    j = json{{"old_start", hunk.old_start},
             {"old_count", hunk.old_count},
             {"new_start", hunk.new_start},
             {"new_count", hunk.new_count},
             {"lines", hunk.lines}};
}

void
effdiff::from_json(const json& j, Hunk& hunk) {
    j.at("old_start").get_to(hunk.old_start);
    j.at("old_count").get_to(hunk.old_count);
    j.at("new_start").get_to(hunk.new_start);
    j.at("new_count").get_to(hunk.new_count);
    j.at("lines").get_to(hunk.lines);
}

void
effdiff::to_json(json& j, const FileDiff& file) {
    j = json{{"old_path", file.old_path}, {"new_path", file.new_path}, {"hunks", file.hunks}};
}

void
effdiff::from_json(const json& j, FileDiff& file) {
    j.at("old_path").get_to(file.old_path);
    j.at("new_path").get_to(file.new_path);
    j.at("hunks").get_to(file.hunks);
}

void
effdiff::to_json(json& j, const GitDiff& diff) {
    j = json{{"commit_hash", diff.commit_hash}, {"files", diff.files}};
}

void
effdiff::from_json(const json& j, GitDiff& diff) {
    diff.commit_hash = j.value("commit_hash", "");
    j.at("files").get_to(diff.files);
}

void
effdiff::to_json(json& j, const MoveReportEntry& entry) {
    j = json{{"source_file", entry.source_file},
             {"target_file", entry.target_file},
             {"source_lines", range_to_json(entry.source_range)},
             {"target_lines", range_to_json(entry.target_range)},
             {"matched_lines", entry.matched_line_count},
             {"score", entry.score},
             {"effective_diff_lines", entry.effective_diff_lines}};
}

void
effdiff::to_json(json& j, const MoveReport& report) {
    j = json{{"moves_detected", report.moves_detected()},
             {"total_lines_moved", report.total_lines_moved},
             {"total_lines_effectively_changed", report.total_lines_effectively_changed},
             {"moves", report.moves}};
}

std::string
effdiff::git_diff_to_json(const GitDiff& diff, int indent) {
    return json(diff).dump(indent);
}

std::string
effdiff::move_report_to_json(const MoveReport& report, int indent) {
    return json(report).dump(indent);
}

bool
effdiff::git_diff_from_json(const std::string& text, GitDiff& diff, std::string& error) {
    try {
        diff = json::parse(text).get<GitDiff>();
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    return true;
}
