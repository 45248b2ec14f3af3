#include "unified.hpp"

#include <fmt/format.h>

using namespace effdiff;

namespace {

std::string
side_path(const std::string& path, const char* prefix) {
    if (path == kNullPath) {
        return path;
    }
    return fmt::format("{}{}", prefix, path);
}

}  // namespace

std::vector<std::string>
effdiff::unified_diff_render(const GitDiff& diff) {
    std::vector<std::string> udiff;

    auto format_change = [](const int64_t start, const int64_t count) -> std::string {
        if (count == 1)
            return fmt::format("{}", start);
        return fmt::format("{},{}", start, count);
    };

    for (const auto& file : diff.files) {
        const std::string& a_path = file.is_created() ? file.new_path : file.old_path;
        const std::string& b_path = file.is_deleted() ? file.old_path : file.new_path;
        udiff.push_back(fmt::format("diff --git a/{} b/{}\n", a_path, b_path));
        if (file.is_created()) {
            udiff.push_back("new file mode 100644\n");
        } else if (file.is_deleted()) {
            udiff.push_back("deleted file mode 100644\n");
        }

        if (file.hunks.empty()) {
            continue;
        }

        udiff.push_back(fmt::format("--- {}\n", side_path(file.old_path, "a/")));
        udiff.push_back(fmt::format("+++ {}\n", side_path(file.new_path, "b/")));

        for (const auto& hunk : file.hunks) {
            udiff.push_back(fmt::format("@@ -{} +{} @@\n", format_change(hunk.old_start, hunk.old_count),
                                        format_change(hunk.new_start, hunk.new_count)));
            for (const auto& line : hunk.lines) {
                std::string op = " ";
                if (line.status == LineStatus::Added)
                    op = "+";
                else if (line.status == LineStatus::Removed)
                    op = "-";

                udiff.push_back(fmt::format("{:1}{}\n", op, line.content));
            }
        }
    }

    return udiff;
}

std::string
effdiff::unified_diff_string(const GitDiff& diff) {
    std::string text;
    for (const auto& line : unified_diff_render(diff)) {
        text += line;
    }
    return text;
}
