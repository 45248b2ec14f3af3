#pragma once

/*
    Effective diff pipeline.

    Extract the changed lines of a diff, match removed lines against added
    ones, aggregate matches into moves, re-diff the regions of every file
    pair touched by a move and assemble the reduced diff and move report.

    Nothing is thrown out of the pipeline. A file pair that cannot be
    re-diffed keeps its original hunks and loses its moves; a failure that
    is not tied to one file pair returns the input diff with an empty
    report.
*/

#include "config/config.hpp"
#include "content/file_contents.hpp"
#include "model/git_diff.hpp"
#include "processing/move_report.hpp"
#include "rediff/rediff.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace effdiff {

class CancellationToken {
   public:
    void
    cancel() {
        cancelled_.store(true);
    }

    bool
    is_cancelled() const {
        return cancelled_.load();
    }

   private:
    std::atomic<bool> cancelled_{false};
};

enum class PipelineStatus {
    Ok,
    FellBack,
    Cancelled,
};

std::string
repr(PipelineStatus status);

enum class DiagnosticKind {
    InvalidInput,
    MissingContent,
    ContentMismatch,
    RediffFailed,
    RediffOutOfRange,
    Reconciled,
    MoveWithdrawn,
    Cancelled,
    Internal,
};

std::string
repr(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind;
    std::string file;
    std::string message;
};

struct PipelineResult {
    GitDiff effective_diff;
    MoveReport move_report;
    PipelineStatus status = PipelineStatus::Ok;
    std::vector<Diagnostic> diagnostics;
};

PipelineResult
run_effective_diff_pipeline(const GitDiff& git_diff,
                            const FileContentProvider& contents,
                            const Rediff& rediff,
                            const EngineOptions& options = {},
                            const CancellationToken* cancel = nullptr);

PipelineResult
run_effective_diff_pipeline(const GitDiff& git_diff,
                            const FileContentMap& old_contents,
                            const FileContentMap& new_contents,
                            const Rediff& rediff,
                            const EngineOptions& options = {},
                            const CancellationToken* cancel = nullptr);

}  // namespace effdiff
