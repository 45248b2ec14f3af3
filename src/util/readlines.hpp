#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace effdiff {

// A line of text without its terminating newline. Equality is exact; the
// checksum only short-circuits comparisons of different lines.
struct Line {
    int64_t line_number;
    uint32_t checksum;

    std::string line;

    uint32_t
    hash() const {
        return checksum;
    }

    bool
    operator==(const Line& other) const {
        return checksum == other.checksum && line == other.line;
    }

    bool
    operator!=(const Line& other) const {
        return !(*this == other);
    }
};

enum class ReadStatus {
    kOk,
    kFileNotFound,
    kIOError,
};

std::string
to_string(ReadStatus status);

// Split text on '\n'. A trailing newline does not start another line.
bool
parselines(const std::string& input_text, std::vector<Line>& lines);

ReadStatus
readfile(const std::string& path, std::string& contents);

// Inverse of parselines for lines that all end in a newline.
std::string
joinlines(const std::vector<std::string>& lines);

}  // namespace effdiff

template <>
struct std::hash<effdiff::Line> {
    std::size_t
    operator()(const effdiff::Line& line) const noexcept {
        return line.checksum;
    }
};
