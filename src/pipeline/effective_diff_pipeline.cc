#include "effective_diff_pipeline.hpp"

#include "processing/block_aggregator.hpp"
#include "processing/diff_reconstruct.hpp"
#include "processing/line_extractor.hpp"
#include "processing/line_matcher.hpp"
#include "processing/region_rediff.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <set>
#include <thread>
#include <tuple>

using namespace effdiff;

namespace {

const std::set<int64_t> kNoLines;

struct PairOutcome {
    bool computed = false;
    std::set<int64_t> moved_old;
    std::set<int64_t> moved_new;
    FilePairResult result;
};

bool
cancelled(const CancellationToken* cancel) {
    return cancel != nullptr && cancel->is_cancelled();
}

size_t
parallelism(const EngineOptions& options) {
    if (options.max_parallelism > 0) {
        return static_cast<size_t>(options.max_parallelism);
    }
    const auto hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : hardware;
}

DiagnosticKind
diagnostic_kind(FilePairStatus status) {
    switch (status) {
        case FilePairStatus::kMissingContent:
            return DiagnosticKind::MissingContent;
        case FilePairStatus::kContentMismatch:
            return DiagnosticKind::ContentMismatch;
        case FilePairStatus::kOutOfRange:
            return DiagnosticKind::RediffOutOfRange;
        case FilePairStatus::kOk:
        case FilePairStatus::kRediffFailed:
            break;
    }
    return DiagnosticKind::RediffFailed;
}

PipelineResult
fallback(const GitDiff& git_diff, PipelineStatus status, std::vector<Diagnostic> diagnostics) {
    PipelineResult result;
    result.effective_diff = git_diff;
    result.status = status;
    result.diagnostics = std::move(diagnostics);
    return result;
}

// Content providers belong to the caller and may throw.
FilePairResult
run_file_pair(const FileDiff& file,
              const FileContentProvider& contents,
              const Rediff& rediff,
              const std::set<int64_t>& moved_old,
              const std::set<int64_t>& moved_new,
              const EngineOptions& options) {
    try {
        return rediff_file_pair(file, contents, rediff, moved_old, moved_new, options);
    } catch (const std::exception& e) {
        FilePairResult result;
        result.status = FilePairStatus::kRediffFailed;
        result.error = fmt::format("file pair task threw: {}", e.what());
        return result;
    } catch (...) {
        FilePairResult result;
        result.status = FilePairStatus::kRediffFailed;
        result.error = "file pair task threw a non-standard exception";
        return result;
    }
}

// Run the pending file pairs, at most `parallelism` at a time. Results are
// collected in the order of `pending`. Returns false if cancelled.
bool
run_batches(const GitDiff& git_diff,
            const std::vector<size_t>& pending,
            const std::vector<PairOutcome>& outcomes,
            const FileContentProvider& contents,
            const Rediff& rediff,
            const EngineOptions& options,
            const CancellationToken* cancel,
            std::vector<FilePairResult>& results) {
    const size_t width = parallelism(options);

    for (size_t begin = 0; begin < pending.size(); begin += width) {
        if (cancelled(cancel)) {
            return false;
        }

        // Futures from std::async join on destruction; an early return
        // leaves no task running against our references.
        std::vector<std::future<FilePairResult>> futures;
        const size_t end = std::min(pending.size(), begin + width);
        for (size_t k = begin; k < end; k++) {
            if (cancelled(cancel)) {
                return false;
            }
            const size_t i = pending[k];
            futures.push_back(std::async(std::launch::async, run_file_pair, std::cref(git_diff.files[i]),
                                         std::cref(contents), std::cref(rediff), std::cref(outcomes[i].moved_old),
                                         std::cref(outcomes[i].moved_new), std::cref(options)));
        }

        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }

    return !cancelled(cancel);
}

bool
touches_pair(const MoveCandidate& move, const FileDiff& file) {
    return (!file.is_created() && move.source_file == file.old_path) ||
           (!file.is_deleted() && move.target_file == file.new_path);
}

PipelineResult
run_pipeline(const GitDiff& git_diff,
             const FileContentProvider& contents,
             const Rediff& rediff,
             const EngineOptions& options,
             const CancellationToken* cancel) {
    std::vector<Diagnostic> diagnostics;

    if (cancelled(cancel)) {
        return fallback(git_diff, PipelineStatus::Cancelled, {{DiagnosticKind::Cancelled, "", "cancelled"}});
    }

    if (auto validation = validate_git_diff(git_diff); !validation.is_ok()) {
        log_debug(options.debug, "input diff rejected ({}): {}", repr(validation.kind), validation.error);
        return fallback(git_diff, PipelineStatus::FellBack,
                        {{DiagnosticKind::InvalidInput, "", validation.error}});
    }

    auto lines = extract_lines(git_diff);
    auto matches = match_lines(lines.removed, lines.added);
    auto candidates = aggregate_blocks(lines, matches, options);

    log_debug(options.debug, "{} removed, {} added lines; {} move candidates", lines.removed.size(),
              lines.added.size(), candidates.size());

    PipelineResult result;
    if (candidates.empty()) {
        result.effective_diff = git_diff;
        result.move_report = build_move_report({}, git_diff, options.context_window);
        return result;
    }

    std::vector<PairOutcome> outcomes(git_diff.files.size());
    std::set<size_t> failed;

    // Withdrawing the moves of a failed pair changes the moved lines of the
    // pairs on their other end, so iterate until no new pair fails.
    while (true) {
        auto moved = MovedLines::from_candidates(candidates);

        std::vector<size_t> pending;
        for (size_t i = 0; i < git_diff.files.size(); i++) {
            const auto& file = git_diff.files[i];
            if (failed.count(i) || !moved.touches(file)) {
                continue;
            }
            const auto& moved_old = file.is_created() ? kNoLines : moved.old_lines_of(file.old_path);
            const auto& moved_new = file.is_deleted() ? kNoLines : moved.new_lines_of(file.new_path);
            auto& outcome = outcomes[i];
            if (outcome.computed && outcome.moved_old == moved_old && outcome.moved_new == moved_new) {
                continue;
            }
            outcome.moved_old = moved_old;
            outcome.moved_new = moved_new;
            pending.push_back(i);
        }

        std::vector<FilePairResult> results;
        if (!run_batches(git_diff, pending, outcomes, contents, rediff, options, cancel, results)) {
            log_debug(options.debug, "cancelled with {} file pairs pending", pending.size());
            diagnostics.push_back({DiagnosticKind::Cancelled, "", "cancelled"});
            return fallback(git_diff, PipelineStatus::Cancelled, std::move(diagnostics));
        }

        std::set<size_t> newly_failed;
        for (size_t k = 0; k < pending.size(); k++) {
            const size_t i = pending[k];
            outcomes[i].computed = true;
            outcomes[i].result = std::move(results[k]);
            if (!outcomes[i].result.is_ok()) {
                const auto& file = git_diff.files[i];
                log_debug(options.debug, "{}: {}; keeping original hunks", file.path(), outcomes[i].result.error);
                diagnostics.push_back(
                    {diagnostic_kind(outcomes[i].result.status), file.path(), outcomes[i].result.error});
                newly_failed.insert(i);
            }
        }
        if (newly_failed.empty()) {
            break;
        }
        failed.insert(newly_failed.begin(), newly_failed.end());

        std::vector<MoveCandidate> kept;
        for (auto& move : candidates) {
            auto touches_failed = std::any_of(failed.begin(), failed.end(), [&](size_t i) {
                return touches_pair(move, git_diff.files[i]);
            });
            if (touches_failed) {
                diagnostics.push_back({DiagnosticKind::MoveWithdrawn, move.source_file,
                                       fmt::format("move {}:{}-{} -> {}:{}-{} withdrawn", move.source_file,
                                                   move.source_range.start, move.source_range.end,
                                                   move.target_file, move.target_range.start,
                                                   move.target_range.end)});
            } else {
                kept.push_back(std::move(move));
            }
        }
        candidates = std::move(kept);
    }

    auto moved = MovedLines::from_candidates(candidates);

    GitDiff& effective = result.effective_diff;
    effective.commit_hash = git_diff.commit_hash;
    for (size_t i = 0; i < git_diff.files.size(); i++) {
        const auto& file = git_diff.files[i];
        if (failed.count(i) || !moved.touches(file)) {
            effective.files.push_back(file);
            continue;
        }

        const auto& outcome = outcomes[i].result;
        if (outcome.reconciled) {
            log_debug(options.debug, "{}: re-diff disagreed with the original changes; filtered them instead",
                      file.path());
            diagnostics.push_back({DiagnosticKind::Reconciled, file.path(), "re-diffed hunks replaced by filtered"
                                                                            " original hunks"});
        }
        // A file whose changes were all moves drops out.
        if (outcome.hunks.empty() && !file.hunks.empty()) {
            continue;
        }
        effective.files.push_back({file.old_path, file.new_path, outcome.hunks});
    }

    std::sort(effective.files.begin(), effective.files.end(), [](const FileDiff& a, const FileDiff& b) {
        return std::tie(a.path(), a.old_path) < std::tie(b.path(), b.old_path);
    });

    if (auto partition = verify_partition(git_diff, effective, candidates); !partition.ok) {
        log_debug(options.debug, "effective diff rejected: {}", partition.error);
        diagnostics.push_back({DiagnosticKind::Internal, "", partition.error});
        return fallback(git_diff, PipelineStatus::FellBack, std::move(diagnostics));
    }

    result.move_report = build_move_report(candidates, effective, options.context_window);
    result.diagnostics = std::move(diagnostics);
    log_debug(options.debug, "{} moves, {} of {} changed lines remain", result.move_report.moves_detected(),
              result.move_report.total_lines_effectively_changed, git_diff.changed_line_count());
    return result;
}

}  // namespace

std::string
effdiff::repr(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::Ok:
            return "ok";
        case PipelineStatus::FellBack:
            return "fell back";
        case PipelineStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string
effdiff::repr(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::InvalidInput:
            return "invalid input";
        case DiagnosticKind::MissingContent:
            return "missing content";
        case DiagnosticKind::ContentMismatch:
            return "content mismatch";
        case DiagnosticKind::RediffFailed:
            return "rediff failed";
        case DiagnosticKind::RediffOutOfRange:
            return "rediff out of range";
        case DiagnosticKind::Reconciled:
            return "reconciled";
        case DiagnosticKind::MoveWithdrawn:
            return "move withdrawn";
        case DiagnosticKind::Cancelled:
            return "cancelled";
        case DiagnosticKind::Internal:
            return "internal";
    }
    return "unknown";
}

PipelineResult
effdiff::run_effective_diff_pipeline(const GitDiff& git_diff,
                                     const FileContentProvider& contents,
                                     const Rediff& rediff,
                                     const EngineOptions& options,
                                     const CancellationToken* cancel) {
    try {
        return run_pipeline(git_diff, contents, rediff, options, cancel);
    } catch (const std::exception& e) {
        log_debug(options.debug, "effective diff pipeline failed: {}", e.what());
        return fallback(git_diff, PipelineStatus::FellBack, {{DiagnosticKind::Internal, "", e.what()}});
    } catch (...) {
        log_debug(options.debug, "effective diff pipeline failed: non-standard exception");
        return fallback(git_diff, PipelineStatus::FellBack,
                        {{DiagnosticKind::Internal, "", "non-standard exception"}});
    }
}

PipelineResult
effdiff::run_effective_diff_pipeline(const GitDiff& git_diff,
                                     const FileContentMap& old_contents,
                                     const FileContentMap& new_contents,
                                     const Rediff& rediff,
                                     const EngineOptions& options,
                                     const CancellationToken* cancel) {
    try {
        InMemoryFileContents contents{old_contents, new_contents};
        return run_effective_diff_pipeline(git_diff, contents, rediff, options, cancel);
    } catch (const std::exception& e) {
        log_debug(options.debug, "effective diff pipeline failed: {}", e.what());
        return fallback(git_diff, PipelineStatus::FellBack, {{DiagnosticKind::Internal, "", e.what()}});
    } catch (...) {
        log_debug(options.debug, "effective diff pipeline failed: non-standard exception");
        return fallback(git_diff, PipelineStatus::FellBack,
                        {{DiagnosticKind::Internal, "", "non-standard exception"}});
    }
}
