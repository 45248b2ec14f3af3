#include "pipeline/effective_diff_pipeline.hpp"

#include "output/json.hpp"
#include "processing/diff_reconstruct.hpp"
#include "rediff/algorithm_rediff.hpp"
#include "util/readlines.hpp"

#include <doctest.h>
#include <fmt/format.h>

#include <atomic>
#include <stdexcept>

using namespace effdiff;

namespace {

std::string
text_of(const std::string& prefix, const std::vector<int>& order) {
    std::vector<std::string> lines;
    for (int n : order) {
        lines.push_back(fmt::format("{}_{}();", prefix, n));
    }
    return joinlines(lines);
}

// Diff two texts the way `git diff -U<context>` would.
FileDiff
make_file_diff(const std::string& old_path,
               const std::string& new_path,
               const std::string& old_text,
               const std::string& new_text,
               int64_t context = 3) {
    AlgorithmRediff differ{Algo::kMyersGreedy, context};
    auto result = differ.rediff(old_text, new_text);
    REQUIRE(result.is_ok());
    return FileDiff{old_path, new_path, result.hunks};
}

struct Fixture {
    GitDiff diff;
    FileContentMap old_contents;
    FileContentMap new_contents;

    void
    add(const std::string& old_path,
        const std::string& new_path,
        const std::string& old_text,
        const std::string& new_text,
        int64_t context = 3) {
        diff.files.push_back(make_file_diff(old_path, new_path, old_text, new_text, context));
        if (old_path != kNullPath) {
            old_contents[old_path] = old_text;
        }
        if (new_path != kNullPath) {
            new_contents[new_path] = new_text;
        }
    }

    PipelineResult
    run(const Rediff& rediff, const EngineOptions& options = {}) const {
        return run_effective_diff_pipeline(diff, old_contents, new_contents, rediff, options);
    }
};

// Lines 3-6 move below line 10.
void
add_intra_file_move(Fixture& fixture, const std::string& path, const std::string& prefix) {
    fixture.add(path, path, text_of(prefix, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}),
                text_of(prefix, {1, 2, 7, 8, 9, 10, 3, 4, 5, 6, 11, 12}));
}

struct PoisonedRediff : public Rediff {
    AlgorithmRediff inner{Algo::kPatience, 3};

    RediffResult
    rediff(const std::string& old_text, const std::string& new_text) const override {
        if (old_text.find("POISON") != std::string::npos) {
            throw std::runtime_error("poisoned region");
        }
        return inner.rediff(old_text, new_text);
    }
};

struct NonStandardThrowRediff : public Rediff {
    AlgorithmRediff inner{Algo::kPatience, 3};

    RediffResult
    rediff(const std::string& old_text, const std::string& new_text) const override {
        if (old_text.find("POISON") != std::string::npos) {
            throw 42;
        }
        return inner.rediff(old_text, new_text);
    }
};

// Cancels the run from inside its first rediff call.
struct CancellingRediff : public Rediff {
    explicit CancellingRediff(CancellationToken& token) : token(token) {
    }

    CancellationToken& token;
    AlgorithmRediff inner{Algo::kPatience, 3};
    mutable std::atomic<int> calls{0};

    RediffResult
    rediff(const std::string& old_text, const std::string& new_text) const override {
        calls++;
        token.cancel();
        return inner.rediff(old_text, new_text);
    }
};

bool
has_diagnostic(const PipelineResult& result, DiagnosticKind kind, const std::string& file) {
    for (const auto& d : result.diagnostics) {
        if (d.kind == kind && d.file == file) {
            return true;
        }
    }
    return false;
}

std::vector<MoveCandidate>
as_candidates(const MoveReport& report) {
    std::vector<MoveCandidate> moves;
    for (const auto& m : report.moves) {
        moves.push_back({m.source_file, m.source_range, m.target_file, m.target_range, m.matched_line_count, m.score});
    }
    return moves;
}

}  // namespace

TEST_CASE("effective_diff_pipeline") {
    AlgorithmRediff rediff{Algo::kPatience, 3};

    SUBCASE("split_hunk") {
        // Lines 10-14 move to new lines 20-24; old line 16 is edited in the
        // same hunk and lands at new line 11.
        std::vector<std::string> old_lines, new_lines;
        for (int i = 1; i <= 30; i++) {
            old_lines.push_back(i >= 10 && i <= 14 ? fmt::format("moved_block_line({});", i)
                                                   : fmt::format("keep_line({});", i));
        }
        for (int i : {1, 2, 3, 4, 5, 6, 7, 8, 9, 15}) {
            new_lines.push_back(fmt::format("keep_line({});", i));
        }
        new_lines.push_back("edited_line(16);");
        for (int i = 17; i <= 24; i++) {
            new_lines.push_back(fmt::format("keep_line({});", i));
        }
        for (int i = 10; i <= 14; i++) {
            new_lines.push_back(fmt::format("moved_block_line({});", i));
        }
        for (int i = 25; i <= 30; i++) {
            new_lines.push_back(fmt::format("keep_line({});", i));
        }

        Fixture fixture;
        fixture.add("src/f.cc", "src/f.cc", joinlines(old_lines), joinlines(new_lines), 5);
        REQUIRE(fixture.diff.files[0].hunks.size() == 1);

        auto result = fixture.run(rediff);

        REQUIRE(result.status == PipelineStatus::Ok);
        REQUIRE(result.move_report.moves_detected() == 1);
        const auto& move = result.move_report.moves[0];
        CHECK(move.source_file == "src/f.cc");
        CHECK(move.target_file == "src/f.cc");
        CHECK(move.source_range == LineRange{10, 14});
        CHECK(move.target_range == LineRange{20, 24});
        CHECK(move.matched_line_count == 5);

        REQUIRE(result.effective_diff.files.size() == 1);
        const auto& hunks = result.effective_diff.files[0].hunks;
        REQUIRE(hunks.size() == 1);
        std::vector<DiffLine> changes;
        for (const auto& line : hunks[0].lines) {
            if (line.is_change()) {
                changes.push_back(line);
            }
        }
        REQUIRE(changes.size() == 2);
        CHECK(changes[0] == DiffLine::removed("keep_line(16);", 16));
        CHECK(changes[1] == DiffLine::added("edited_line(16);", 11));

        CHECK(result.move_report.total_lines_moved == 5);
        CHECK(result.move_report.total_lines_effectively_changed == 2);
        CHECK(move.effective_diff_lines == 0);
        CHECK(validate_git_diff(result.effective_diff).is_ok());
    }

    SUBCASE("cross_file_move") {
        Fixture fixture;
        fixture.add("src/a.cc", "src/a.cc", text_of("alpha", {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}),
                    text_of("alpha", {1, 2, 3, 4, 9, 10, 11, 12}));
        fixture.add(kNullPath, "src/b.cc", "", text_of("alpha", {5, 6, 7, 8}));

        auto result = fixture.run(rediff);

        REQUIRE(result.status == PipelineStatus::Ok);
        REQUIRE(result.move_report.moves_detected() == 1);
        const auto& move = result.move_report.moves[0];
        CHECK(move.source_file == "src/a.cc");
        CHECK(move.source_range == LineRange{5, 8});
        CHECK(move.target_file == "src/b.cc");
        CHECK(move.target_range == LineRange{1, 4});

        // Nothing but the move happened.
        CHECK(result.effective_diff.files.empty());
        CHECK(result.effective_diff.commit_hash == fixture.diff.commit_hash);
    }

    SUBCASE("graceful_degradation") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");
        add_intra_file_move(fixture, "b.cc", "b_POISON");
        add_intra_file_move(fixture, "c.cc", "c");

        PoisonedRediff poisoned;
        auto result = fixture.run(poisoned);

        REQUIRE(result.status == PipelineStatus::Ok);
        REQUIRE(result.move_report.moves_detected() == 2);
        CHECK(result.move_report.moves[0].source_file == "a.cc");
        CHECK(result.move_report.moves[1].source_file == "c.cc");

        REQUIRE(result.effective_diff.files.size() == 1);
        CHECK(result.effective_diff.files[0] == fixture.diff.files[1]);

        CHECK(has_diagnostic(result, DiagnosticKind::RediffFailed, "b.cc"));
        CHECK(has_diagnostic(result, DiagnosticKind::MoveWithdrawn, "b.cc"));
    }

    SUBCASE("non_standard_exception_degrades_one_pair") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");
        add_intra_file_move(fixture, "b.cc", "b_POISON");

        NonStandardThrowRediff throwing;
        auto result = fixture.run(throwing);

        REQUIRE(result.status == PipelineStatus::Ok);
        REQUIRE(result.move_report.moves_detected() == 1);
        CHECK(result.move_report.moves[0].source_file == "a.cc");
        REQUIRE(result.effective_diff.files.size() == 1);
        CHECK(result.effective_diff.files[0] == fixture.diff.files[1]);
        CHECK(has_diagnostic(result, DiagnosticKind::RediffFailed, "b.cc"));
    }

    SUBCASE("no_op_without_moves") {
        Fixture fixture;
        fixture.add("x.cc", "x.cc", text_of("x", {1, 2, 3, 4, 5, 6}), text_of("x", {1, 2, 7, 4, 5, 6, 8}));
        fixture.add("y.cc", "y.cc", text_of("y", {1, 2, 3}), text_of("y", {1, 9, 3}));

        auto result = fixture.run(rediff);

        CHECK(result.status == PipelineStatus::Ok);
        CHECK(result.effective_diff == fixture.diff);
        CHECK(result.move_report.empty());
        CHECK(result.diagnostics.empty());
    }

    SUBCASE("duplicated_blank_line_never_moves") {
        Fixture fixture;
        fixture.add("x.cc", "x.cc", "int a;\n\nint b;\nint c;\n", "int a;\nint b;\nint c;\n\n");

        auto result = fixture.run(rediff);

        CHECK(result.move_report.empty());
        CHECK(result.effective_diff == fixture.diff);
    }

    SUBCASE("determinism") {
        Fixture fixture;
        add_intra_file_move(fixture, "z.cc", "z");
        add_intra_file_move(fixture, "a.cc", "a");
        fixture.add("m.cc", "m.cc", text_of("m", {1, 2, 3, 4, 5, 6, 7, 8}), text_of("m", {1, 2, 3, 9, 5, 6, 7, 8}));
        fixture.add("n.cc", kNullPath, text_of("shared", {1, 2, 3, 4}), "");
        fixture.add(kNullPath, "o.cc", "", text_of("shared", {1, 2, 3, 4}));

        EngineOptions serial;
        serial.max_parallelism = 1;
        EngineOptions wide;
        wide.max_parallelism = 16;

        auto first = fixture.run(rediff, serial);
        auto second = fixture.run(rediff, wide);
        auto third = fixture.run(rediff);

        REQUIRE(first.status == PipelineStatus::Ok);
        CHECK(git_diff_to_json(first.effective_diff) == git_diff_to_json(second.effective_diff));
        CHECK(git_diff_to_json(first.effective_diff) == git_diff_to_json(third.effective_diff));
        CHECK(move_report_to_json(first.move_report) == move_report_to_json(second.move_report));
        CHECK(move_report_to_json(first.move_report) == move_report_to_json(third.move_report));

        // Files come out sorted by path.
        REQUIRE(first.effective_diff.files.size() == 1);
        CHECK(first.effective_diff.files[0].path() == "m.cc");
        CHECK(first.move_report.moves_detected() == 3);
    }

    SUBCASE("no_loss_no_duplication") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");
        fixture.add("b.cc", "b.cc", text_of("b", {1, 2, 3, 4, 5, 6, 7}), text_of("b", {1, 5, 6, 7, 8}));
        fixture.add(kNullPath, "c.cc", "", text_of("b", {2, 3, 4, 9}));

        auto result = fixture.run(rediff);

        REQUIRE(result.status == PipelineStatus::Ok);
        auto partition = verify_partition(fixture.diff, result.effective_diff, as_candidates(result.move_report));
        CHECK(partition.ok);
        CHECK(result.move_report.total_lines_moved * 2 + result.move_report.total_lines_effectively_changed ==
              fixture.diff.changed_line_count());
    }

    SUBCASE("score_grows_with_matched_lines") {
        Fixture fixture;
        fixture.add("long.cc", kNullPath, text_of("long", {1, 2, 3, 4, 5, 6}), "");
        fixture.add("short.cc", kNullPath, text_of("short", {1, 2, 3}), "");
        fixture.add(kNullPath, "merged.cc", "", text_of("short", {1, 2, 3}) + text_of("long", {1, 2, 3, 4, 5, 6}));

        auto result = fixture.run(rediff);

        REQUIRE(result.move_report.moves_detected() == 2);
        const auto& longer = result.move_report.moves[0];
        const auto& shorter = result.move_report.moves[1];
        CHECK(longer.source_file == "long.cc");
        CHECK(longer.matched_line_count == 6);
        CHECK(shorter.matched_line_count == 3);
        CHECK(longer.score > shorter.score);
    }

    SUBCASE("missing_content_degrades_one_pair") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");
        add_intra_file_move(fixture, "b.cc", "b");
        fixture.new_contents.erase("b.cc");

        auto result = fixture.run(rediff);

        REQUIRE(result.status == PipelineStatus::Ok);
        CHECK(has_diagnostic(result, DiagnosticKind::MissingContent, "b.cc"));
        REQUIRE(result.move_report.moves_detected() == 1);
        CHECK(result.move_report.moves[0].source_file == "a.cc");
        REQUIRE(result.effective_diff.files.size() == 1);
        CHECK(result.effective_diff.files[0] == fixture.diff.files[1]);
    }

    SUBCASE("malformed_input_falls_back") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");
        fixture.diff.files[0].hunks[0].old_count += 1;

        auto result = fixture.run(rediff);

        CHECK(result.status == PipelineStatus::FellBack);
        CHECK(result.effective_diff == fixture.diff);
        CHECK(result.move_report.empty());
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].kind == DiagnosticKind::InvalidInput);
    }

    SUBCASE("cancelled") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");

        CancellationToken token;
        token.cancel();
        auto result = run_effective_diff_pipeline(fixture.diff, fixture.old_contents, fixture.new_contents, rediff,
                                                  EngineOptions{}, &token);

        CHECK(result.status == PipelineStatus::Cancelled);
        CHECK(result.effective_diff == fixture.diff);
        CHECK(result.move_report.empty());
    }

    SUBCASE("cancelled_between_file_pairs") {
        Fixture fixture;
        add_intra_file_move(fixture, "a.cc", "a");
        add_intra_file_move(fixture, "b.cc", "b");
        add_intra_file_move(fixture, "c.cc", "c");

        CancellationToken token;
        CancellingRediff cancelling{token};
        EngineOptions options;
        options.max_parallelism = 1;
        auto result = run_effective_diff_pipeline(fixture.diff, fixture.old_contents, fixture.new_contents,
                                                  cancelling, options, &token);

        CHECK(cancelling.calls.load() == 1);
        CHECK(result.status == PipelineStatus::Cancelled);
        CHECK(result.effective_diff == fixture.diff);
        CHECK(result.move_report.empty());
        CHECK(has_diagnostic(result, DiagnosticKind::Cancelled, ""));
    }
}
