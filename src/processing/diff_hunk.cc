#include "diff_hunk.hpp"

#include <algorithm>

using namespace effdiff;

namespace {

struct HunkRange {
    int64_t start;
    int64_t end;
};

// Take a sequence of edits and filter out all common lines.
// Return a list of all ranges with consecutive delete and insertions.
std::vector<HunkRange>
find_hunk_ranges(const std::vector<Edit>& edit_sequence) {
    std::vector<HunkRange> hunk_ranges;
    bool in_hunk = false;
    for (size_t i = 0; i < edit_sequence.size(); i++) {
        const auto index = static_cast<int64_t>(i);
        if (edit_sequence[i].type == EditType::Common) {
            in_hunk = false;
        } else if (in_hunk) {
            hunk_ranges.back().end = index;
        } else {
            hunk_ranges.push_back({index, index});
            in_hunk = true;
        }
    }
    return hunk_ranges;
}

// Combine adjacent hunk ranges. Take number of context lines into consideration.
std::vector<HunkRange>
extend_hunk_ranges(const std::vector<Edit>& edit_sequence,
                   const std::vector<HunkRange>& hunk_ranges,
                   const int64_t context_size) {
    std::vector<HunkRange> context_ranges;
    for (const auto& range : hunk_ranges) {
        // Combine hunks if they are separated by at most twice `context_size`
        // common lines; the trailing context of one would touch the leading
        // context of the next.
        if (!context_ranges.empty() && range.start - context_ranges.back().end - 1 <= context_size * 2) {
            context_ranges.back().end = range.end;
        } else {
            context_ranges.push_back(range);
        }
    }

    const auto last = static_cast<int64_t>(edit_sequence.size()) - 1;
    for (auto& range : context_ranges) {
        range.start = std::max<int64_t>(0, range.start - context_size);
        range.end = std::min(last, range.end + context_size);
    }
    return context_ranges;
}

}  // namespace

// Compose a list of Hunks from a sequence of edits.
std::vector<Hunk>
effdiff::compose_hunks(const std::vector<Edit>& edit_sequence,
                       gsl::span<const Line> a,
                       gsl::span<const Line> b,
                       const int64_t context_size) {
    // Start by finding all hunks without taking context size into consideration.
    auto hunk_ranges = find_hunk_ranges(edit_sequence);

    // And then extend the ranges to include context lines. Join adjacent hunk ranges.
    std::vector<HunkRange> hunk_ranges_with_context =
        extend_hunk_ranges(edit_sequence, hunk_ranges, std::max<int64_t>(0, context_size));

    // Number of units of each input consumed before an edit.
    struct InsertionPoint {
        int64_t a_insertion_point = 0;
        int64_t b_insertion_point = 0;
    };
    std::vector<InsertionPoint> insertion_points;
    insertion_points.reserve(edit_sequence.size());
    {
        int64_t a_count = 0, b_count = 0;
        for (const auto& e : edit_sequence) {
            insertion_points.push_back({a_count, b_count});
            if (e.type != EditType::Insert) {
                a_count++;
            }
            if (e.type != EditType::Delete) {
                b_count++;
            }
        }
    }

    std::vector<Hunk> hunks;
    for (const auto& hunk_range : hunk_ranges_with_context) {
        const auto range_start = static_cast<size_t>(hunk_range.start);
        const auto range_end = static_cast<size_t>(hunk_range.end);

        const int64_t a_before = insertion_points[range_start].a_insertion_point;
        const int64_t b_before = insertion_points[range_start].b_insertion_point;
        int64_t a_line = a_before + 1;
        int64_t b_line = b_before + 1;

        Hunk hunk;
        for (auto i = range_start; i <= range_end; i++) {
            const auto& e = edit_sequence[i];
            switch (e.type) {
                case EditType::Insert:
                    hunk.lines.push_back(DiffLine::added(b[static_cast<size_t>(e.b_index.value)].line, b_line++));
                    hunk.new_count++;
                    break;
                case EditType::Delete:
                    hunk.lines.push_back(DiffLine::removed(a[static_cast<size_t>(e.a_index.value)].line, a_line++));
                    hunk.old_count++;
                    break;
                case EditType::Common:
                    hunk.lines.push_back(
                        DiffLine::context(a[static_cast<size_t>(e.a_index.value)].line, a_line++, b_line++));
                    hunk.old_count++;
                    hunk.new_count++;
                    break;
            }
        }

        hunk.old_start = hunk.old_count > 0 ? a_before + 1 : a_before;
        hunk.new_start = hunk.new_count > 0 ? b_before + 1 : b_before;
        hunks.push_back(std::move(hunk));
    }

    return hunks;
}
