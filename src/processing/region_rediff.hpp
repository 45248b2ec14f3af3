#pragma once

/*
    Re-diff the regions of a file pair around its original hunks.

    Each region is the span of one or more hunks padded by a context window
    and clamped to the file. Moved lines are left out of the residual texts
    handed to the re-differ, and every residual line keeps its absolute line
    number so the resulting hunks can be mapped back onto the file.
*/

#include "config/config.hpp"
#include "content/file_contents.hpp"
#include "model/git_diff.hpp"
#include "processing/diff_reconstruct.hpp"
#include "rediff/rediff.hpp"
#include "util/readlines.hpp"

#include <set>
#include <string>
#include <vector>

namespace effdiff {

// Half-open ranges of 1-based line numbers on both sides.
struct Region {
    int64_t old_begin = 1;
    int64_t old_end = 1;
    int64_t new_begin = 1;
    int64_t new_end = 1;
};

std::vector<Region>
residual_regions(const FileDiff& file, int64_t old_line_count, int64_t new_line_count, int64_t context_window);

struct ResidualRegion {
    Region region;

    // Surviving lines; Line::line_number holds the absolute line number.
    std::vector<Line> old_lines;
    std::vector<Line> new_lines;

    std::string
    old_text() const;
    std::string
    new_text() const;
};

ResidualRegion
build_residual(const Region& region,
               const std::vector<Line>& old_file,
               const std::vector<Line>& new_file,
               const std::set<int64_t>& moved_old,
               const std::set<int64_t>& moved_new);

// Map hunks in residual coordinates onto absolute line numbers. Fails if a
// hunk line falls outside the residual texts or does not match them.
bool
remap_residual_hunks(const ResidualRegion& residual,
                     const std::vector<Hunk>& hunks,
                     std::vector<PositionedLine>& lines,
                     std::string& error);

enum class FilePairStatus {
    kOk,
    kMissingContent,
    kContentMismatch,
    kRediffFailed,
    kOutOfRange,
};

std::string
repr(FilePairStatus status);

struct FilePairResult {
    FilePairStatus status = FilePairStatus::kOk;
    std::string error;

    std::vector<Hunk> hunks;

    // The re-diffed hunks disagreed with the expected surviving lines and
    // the original hunks were filtered instead.
    bool reconciled = false;

    bool
    is_ok() const {
        return status == FilePairStatus::kOk;
    }
};

FilePairResult
rediff_file_pair(const FileDiff& file,
                 const FileContentProvider& contents,
                 const Rediff& rediff,
                 const std::set<int64_t>& moved_old,
                 const std::set<int64_t>& moved_new,
                 const EngineOptions& options);

}  // namespace effdiff
