#pragma once

/*
    JSON form of the diff model and the move report.

    Absent line numbers are written as null. Line ranges are written as
    two-element [start, end] arrays.
*/

#include "model/git_diff.hpp"
#include "processing/move_report.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace effdiff {

void
to_json(nlohmann::json& j, const DiffLine& line);
void
from_json(const nlohmann::json& j, DiffLine& line);

void
to_json(nlohmann::json& j, const Hunk& hunk);
void
from_json(const nlohmann::json& j, Hunk& hunk);

void
to_json(nlohmann::json& j, const FileDiff& file);
void
from_json(const nlohmann::json& j, FileDiff& file);

void
to_json(nlohmann::json& j, const GitDiff& diff);
void
from_json(const nlohmann::json& j, GitDiff& diff);

void
to_json(nlohmann::json& j, const MoveReportEntry& entry);

void
to_json(nlohmann::json& j, const MoveReport& report);

std::string
git_diff_to_json(const GitDiff& diff, int indent = 2);

std::string
move_report_to_json(const MoveReport& report, int indent = 2);

// Returns false with `error` set when the text is not a JSON diff.
bool
git_diff_from_json(const std::string& text, GitDiff& diff, std::string& error);

}  // namespace effdiff
