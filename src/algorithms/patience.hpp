#pragma once

// Patience diff: anchor on lines that are unique on both sides, keep the
// longest increasing run of anchors and recurse between them. Slices
// without anchors fall back to greedy Myers.

#include "algorithm.hpp"
#include "myers_greedy.hpp"

#include <algorithm>
#include <gsl/span>
#include <numeric>  // std::accumulate
#include <unordered_map>

namespace effdiff {

template <typename Unit>
struct Patience : public Algorithm<Unit> {
    struct Slice {
        int64_t a_low = 0;
        int64_t a_high = 0;
        int64_t b_low = 0;
        int64_t b_high = 0;

        bool
        empty() const {
            return !(a_low < a_high && b_low < b_high);
        }
    };

    struct Match {
        int64_t a_index;
        int64_t b_index;
    };

    int64_t N;
    int64_t M;

    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    explicit Patience(DiffInput<Unit> diff_input)
        : Algorithm<Unit>(diff_input)
        , N(static_cast<int64_t>(diff_input.A.size()))
        , M(static_cast<int64_t>(diff_input.B.size()))
        , A(diff_input.A)
        , B(diff_input.B) {
    }

    // Pairs of units occurring exactly once in both halves of the slice,
    // ordered by their position in A.
    std::vector<Match>
    index_unique_lines(const Slice& s) const {
        struct record {
            int64_t a_count = 0;
            int64_t b_count = 0;
            int64_t a_index = 0;
            int64_t b_index = 0;
        };

        std::unordered_map<Unit, record> records;

        for (auto i = s.a_low; i < s.a_high; i++) {
            auto& r = records[A[i]];
            r.a_count++;
            r.a_index = i;
        }

        for (auto i = s.b_low; i < s.b_high; i++) {
            auto it = records.find(B[i]);
            if (it == records.end()) {
                continue;
            }
            it->second.b_count++;
            it->second.b_index = i;
        }

        std::vector<Match> matches;
        for (const auto& kv : records) {
            if (kv.second.a_count == 1 && kv.second.b_count == 1) {
                matches.push_back({kv.second.a_index, kv.second.b_index});
            }
        }

        std::sort(matches.begin(), matches.end(),
                  [](const Match& a, const Match& b) { return a.a_index < b.a_index; });

        return matches;
    }

    // Longest subsequence of `matches` increasing in b_index.
    static std::vector<Match>
    patience_sort(const std::vector<Match>& matches) {
        std::vector<size_t> stack_tops;
        std::vector<int64_t> prev(matches.size(), -1);

        for (size_t i = 0; i < matches.size(); i++) {
            const auto found =
                std::lower_bound(stack_tops.begin(), stack_tops.end(), matches[i].b_index,
                                 [&matches](size_t top, int64_t b) { return matches[top].b_index < b; });
            if (found != stack_tops.begin()) {
                prev[i] = static_cast<int64_t>(*(found - 1));
            }
            if (found == stack_tops.end()) {
                stack_tops.push_back(i);
            } else {
                *found = i;
            }
        }

        std::vector<Match> sequence;
        if (stack_tops.empty()) {
            return sequence;
        }
        for (int64_t i = static_cast<int64_t>(stack_tops.back()); i >= 0; i = prev[static_cast<size_t>(i)]) {
            sequence.push_back(matches[static_cast<size_t>(i)]);
        }
        std::reverse(sequence.begin(), sequence.end());
        return sequence;
    }

    std::vector<Edit>
    fallback_diff(const Slice& s) const {
        const auto a_count = static_cast<size_t>(s.a_high - s.a_low);
        const auto b_count = static_cast<size_t>(s.b_high - s.b_low);

        DiffInput<Unit> algo_input{A.subspan(static_cast<size_t>(s.a_low), a_count),
                                   B.subspan(static_cast<size_t>(s.b_low), b_count)};
        MyersGreedy<Unit> differ{algo_input};
        auto result = differ.compute();

        for (auto& e : result.edit_sequence) {
            if (e.a_index.valid) {
                e.a_index.value += s.a_low;
            }
            if (e.b_index.valid) {
                e.b_index.value += s.b_low;
            }
        }

        return result.edit_sequence;
    }

    void
    do_diff(Slice slice, std::vector<Edit>& edit_sequence) const {
        std::vector<Edit> tail;
        while (!slice.empty() && A[slice.a_low] == B[slice.b_low]) {
            edit_sequence.push_back({EditType::Common, EditIndex(slice.a_low), EditIndex(slice.b_low)});
            slice.a_low += 1;
            slice.b_low += 1;
        }
        while (!slice.empty() && A[slice.a_high - 1] == B[slice.b_high - 1]) {
            slice.a_high -= 1;
            slice.b_high -= 1;
            tail.push_back({EditType::Common, EditIndex(slice.a_high), EditIndex(slice.b_high)});
        }

        auto anchors = patience_sort(index_unique_lines(slice));
        if (anchors.empty()) {
            for (const auto& e : fallback_diff(slice)) {
                edit_sequence.push_back(e);
            }
        } else {
            auto a_index = slice.a_low;
            auto b_index = slice.b_low;
            for (const auto& anchor : anchors) {
                do_diff({a_index, anchor.a_index, b_index, anchor.b_index}, edit_sequence);
                edit_sequence.push_back({EditType::Common, EditIndex(anchor.a_index), EditIndex(anchor.b_index)});
                a_index = anchor.a_index + 1;
                b_index = anchor.b_index + 1;
            }
            do_diff({a_index, slice.a_high, b_index, slice.b_high}, edit_sequence);
        }

        edit_sequence.insert(edit_sequence.end(), tail.rbegin(), tail.rend());
    }

    DiffResult
    diff() override {
        DiffResult result;
        do_diff(Slice{0, N, 0, M}, result.edit_sequence);
        int64_t common_count = std::accumulate(
            result.edit_sequence.begin(), result.edit_sequence.end(), (int64_t) 0,
            [](int64_t acc, const auto& e) { return e.type == EditType::Common ? acc + 1 : acc; });
        result.status = (N == M && N == common_count) ? DiffResultStatus::NoChanges : DiffResultStatus::OK;
        return result;
    }
};

}  // namespace effdiff
