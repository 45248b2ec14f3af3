#include "processing/region_rediff.hpp"

#include "model/unified_reader.hpp"
#include "rediff/algorithm_rediff.hpp"

#include <doctest.h>

#include <stdexcept>

using namespace effdiff;

namespace {

GitDiff
read_diff(const std::string& text) {
    GitDiff diff;
    DiffParseResult result;
    parse_unified_diff(text, "", diff, result);
    REQUIRE(result.is_ok());
    return diff;
}

// Lines 3-5 move below line 10, and line 7 is edited.
const char* kOldFile = "a1\na2\nm3\nm4\nm5\na6\ne7\na8\na9\na10\na11\na12\n";
const char* kNewFile = "a1\na2\na6\nE7\na8\na9\na10\nm3\nm4\nm5\na11\na12\n";
const char* kDiff = R"foo(--- a/f.txt
+++ b/f.txt
@@ -1,12 +1,12 @@
 a1
 a2
-m3
-m4
-m5
 a6
-e7
+E7
 a8
 a9
 a10
+m3
+m4
+m5
 a11
 a12
)foo";

struct ThrowingRediff : public Rediff {
    RediffResult
    rediff(const std::string&, const std::string&) const override {
        throw std::runtime_error("differ crashed");
    }
};

struct FailingRediff : public Rediff {
    RediffResult
    rediff(const std::string&, const std::string&) const override {
        RediffResult result;
        result.error = "no differ available";
        return result;
    }
};

// Reports a removal of a line the residual text does not have.
struct OutOfRangeRediff : public Rediff {
    RediffResult
    rediff(const std::string&, const std::string&) const override {
        RediffResult result;
        result.status = RediffStatus::kOk;
        result.hunks.push_back({500, 1, 499, 0, {DiffLine::removed("ghost", 500)}});
        return result;
    }
};

}  // namespace

TEST_CASE("residual_regions") {
    FileDiff file{"f", "f", {}};
    file.hunks.push_back({5, 1, 5, 1, {DiffLine::removed("x", 5), DiffLine::added("y", 5)}});
    file.hunks.push_back({20, 1, 20, 1, {DiffLine::removed("x", 20), DiffLine::added("y", 20)}});

    SUBCASE("padded_and_clamped") {
        auto regions = residual_regions(file, 21, 21, 3);
        REQUIRE(regions.size() == 2);
        CHECK(regions[0].old_begin == 2);
        CHECK(regions[0].old_end == 9);
        CHECK(regions[1].old_begin == 17);
        CHECK(regions[1].old_end == 22);
        CHECK(regions[1].new_end == 22);
    }

    SUBCASE("touching_regions_merge") {
        auto regions = residual_regions(file, 30, 30, 7);
        REQUIRE(regions.size() == 1);
        CHECK(regions[0].old_begin == 1);
        CHECK(regions[0].old_end == 28);
    }
}

TEST_CASE("build_residual") {
    std::vector<Line> old_file, new_file;
    parselines(kOldFile, old_file);
    parselines(kNewFile, new_file);

    auto residual = build_residual({1, 13, 1, 13}, old_file, new_file, {3, 4, 5}, {8, 9, 10});

    CHECK(residual.old_text() == "a1\na2\na6\ne7\na8\na9\na10\na11\na12\n");
    CHECK(residual.new_text() == "a1\na2\na6\nE7\na8\na9\na10\na11\na12\n");
    REQUIRE(residual.old_lines.size() == 9);
    CHECK(residual.old_lines[2].line_number == 6);
    CHECK(residual.new_lines[7].line_number == 11);
}

TEST_CASE("rediff_file_pair") {
    auto diff = read_diff(kDiff);
    const auto& file = diff.files[0];
    InMemoryFileContents contents{{{"f.txt", kOldFile}}, {{"f.txt", kNewFile}}};
    EngineOptions options;

    SUBCASE("moved_lines_are_elided") {
        AlgorithmRediff rediff{Algo::kMyersGreedy, 3};
        auto result = rediff_file_pair(file, contents, rediff, {3, 4, 5}, {8, 9, 10}, options);

        REQUIRE(result.is_ok());
        CHECK(!result.reconciled);
        REQUIRE(result.hunks.size() == 1);
        const auto& h = result.hunks[0];
        CHECK(h.old_start == 6);
        CHECK(h.old_count == 5);
        CHECK(h.new_start == 3);
        CHECK(h.new_count == 5);
        CHECK(h.lines[1] == DiffLine::removed("e7", 7));
        CHECK(h.lines[2] == DiffLine::added("E7", 4));
    }

    SUBCASE("nothing_moved_reproduces_the_changes") {
        AlgorithmRediff rediff{Algo::kPatience, 3};
        auto result = rediff_file_pair(file, contents, rediff, {}, {}, options);

        REQUIRE(result.is_ok());
        CHECK(changed_lines(result.hunks) == changed_lines(file.hunks));
    }

    SUBCASE("throwing_rediff") {
        ThrowingRediff rediff;
        auto result = rediff_file_pair(file, contents, rediff, {3, 4, 5}, {8, 9, 10}, options);
        CHECK(result.status == FilePairStatus::kRediffFailed);
        CHECK(result.error.find("differ crashed") != std::string::npos);
        CHECK(result.hunks.empty());
    }

    SUBCASE("failing_rediff") {
        FailingRediff rediff;
        auto result = rediff_file_pair(file, contents, rediff, {}, {}, options);
        CHECK(result.status == FilePairStatus::kRediffFailed);
        CHECK(result.error == "no differ available");
    }

    SUBCASE("out_of_range_hunks") {
        OutOfRangeRediff rediff;
        auto result = rediff_file_pair(file, contents, rediff, {}, {}, options);
        CHECK(result.status == FilePairStatus::kOutOfRange);
    }

    SUBCASE("missing_content") {
        InMemoryFileContents only_old{{{"f.txt", kOldFile}}, {}};
        AlgorithmRediff rediff{Algo::kPatience, 3};
        auto result = rediff_file_pair(file, only_old, rediff, {}, {}, options);
        CHECK(result.status == FilePairStatus::kMissingContent);
    }

    SUBCASE("content_mismatch") {
        InMemoryFileContents stale{{{"f.txt", kNewFile}}, {{"f.txt", kNewFile}}};
        AlgorithmRediff rediff{Algo::kPatience, 3};
        auto result = rediff_file_pair(file, stale, rediff, {}, {}, options);
        CHECK(result.status == FilePairStatus::kContentMismatch);
    }
}
