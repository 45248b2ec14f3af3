#include "processing/diff_hunk.hpp"

#include "algorithms/myers_greedy.hpp"

#include <doctest.h>

using namespace effdiff;

namespace {

std::vector<Line>
numbered_lines(int64_t count) {
    std::string text;
    for (int64_t i = 1; i <= count; i++) {
        text += std::to_string(i) + "\n";
    }
    std::vector<Line> lines;
    parselines(text, lines);
    return lines;
}

std::vector<Line>
replace_line(std::vector<Line> lines, int64_t line_number, const std::string& text) {
    std::vector<Line> replacement;
    parselines(text, replacement);
    lines[static_cast<size_t>(line_number - 1)] = replacement[0];
    return lines;
}

std::vector<Hunk>
hunks_for(const std::vector<Line>& a, const std::vector<Line>& b, int64_t context) {
    MyersGreedy<Line> differ{DiffInput<Line>{a, b}};
    auto result = differ.compute();
    return compose_hunks(result.edit_sequence, a, b, context);
}

}  // namespace

TEST_CASE("compose_hunks") {
    SUBCASE("single_change_with_context") {
        auto a = numbered_lines(10);
        auto b = replace_line(a, 5, "five");
        auto hunks = hunks_for(a, b, 3);

        REQUIRE(hunks.size() == 1);
        const auto& h = hunks[0];
        CHECK(h.old_start == 2);
        CHECK(h.old_count == 7);
        CHECK(h.new_start == 2);
        CHECK(h.new_count == 7);
        REQUIRE(h.lines.size() == 8);
        CHECK(h.lines[0] == DiffLine::context("2", 2, 2));
        CHECK(h.lines[3] == DiffLine::removed("5", 5));
        CHECK(h.lines[4] == DiffLine::added("five", 5));
        CHECK(h.lines[7] == DiffLine::context("8", 8, 8));
    }

    SUBCASE("context_clamped_at_edges") {
        auto a = numbered_lines(3);
        auto b = replace_line(a, 1, "one");
        auto hunks = hunks_for(a, b, 3);

        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].old_start == 1);
        CHECK(hunks[0].old_count == 3);
        CHECK(hunks[0].lines.size() == 4);
    }

    SUBCASE("nearby_changes_merge") {
        auto a = numbered_lines(20);
        auto b = replace_line(replace_line(a, 5, "five"), 12, "twelve");
        // Six common lines between the changes.
        REQUIRE(hunks_for(a, b, 3).size() == 1);
        REQUIRE(hunks_for(a, b, 2).size() == 2);
    }

    SUBCASE("pure_insertion_at_start") {
        auto a = numbered_lines(2);
        std::vector<Line> b;
        parselines("0\n1\n2\n", b);
        auto hunks = hunks_for(a, b, 0);

        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].old_start == 0);
        CHECK(hunks[0].old_count == 0);
        CHECK(hunks[0].new_start == 1);
        CHECK(hunks[0].new_count == 1);
        CHECK(hunks[0].lines[0] == DiffLine::added("0", 1));
    }

    SUBCASE("pure_deletion_in_middle") {
        auto a = numbered_lines(5);
        std::vector<Line> b;
        parselines("1\n2\n4\n5\n", b);
        auto hunks = hunks_for(a, b, 0);

        REQUIRE(hunks.size() == 1);
        CHECK(hunks[0].old_start == 3);
        CHECK(hunks[0].old_count == 1);
        CHECK(hunks[0].new_start == 2);
        CHECK(hunks[0].new_count == 0);
    }

    SUBCASE("no_changes") {
        auto a = numbered_lines(4);
        REQUIRE(hunks_for(a, a, 3).empty());
    }
}
