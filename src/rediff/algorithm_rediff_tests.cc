#include "rediff/algorithm_rediff.hpp"

#include <doctest.h>

using namespace effdiff;

TEST_CASE("algorithm_rediff") {
    SUBCASE("identical_texts_have_no_hunks") {
        AlgorithmRediff rediff{Algo::kPatience, 3};
        auto result = rediff.rediff("a\nb\n", "a\nb\n");
        REQUIRE(result.is_ok());
        REQUIRE(result.hunks.empty());
    }

    SUBCASE("local_line_numbers") {
        AlgorithmRediff rediff{Algo::kMyersGreedy, 0};
        auto result = rediff.rediff("a\nb\nc\n", "a\nB\nc\n");
        REQUIRE(result.is_ok());
        REQUIRE(result.hunks.size() == 1);
        const auto& h = result.hunks[0];
        CHECK(h.old_start == 2);
        CHECK(h.old_count == 1);
        CHECK(h.new_start == 2);
        CHECK(h.new_count == 1);
        REQUIRE(h.lines.size() == 2);
        CHECK(h.lines[0] == DiffLine::removed("b", 2));
        CHECK(h.lines[1] == DiffLine::added("B", 2));
    }

    SUBCASE("empty_old_text") {
        AlgorithmRediff rediff{Algo::kPatience, 3};
        auto result = rediff.rediff("", "x\ny\n");
        REQUIRE(result.is_ok());
        REQUIRE(result.hunks.size() == 1);
        CHECK(result.hunks[0].old_start == 0);
        CHECK(result.hunks[0].old_count == 0);
        CHECK(result.hunks[0].new_count == 2);
    }

    SUBCASE("invalid_algorithm") {
        AlgorithmRediff rediff{Algo::kInvalid, 3};
        auto result = rediff.rediff("a\n", "b\n");
        REQUIRE(!result.is_ok());
        REQUIRE(!result.error.empty());
    }
}
