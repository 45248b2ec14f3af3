#include "readlines.hpp"

#include "util/hash.hpp"

#include <cerrno>
#include <cstdio>
#include <string>
#include <vector>

namespace internal {

struct LineParserState {
    explicit LineParserState(const std::string& source_data) : source(source_data) {
    }

    const std::string& source;
    std::size_t pos = 0;
};

bool
getline(LineParserState& s, std::string& line) {
    if (s.pos >= s.source.size()) {
        return false;
    }

    auto end = s.source.find('\n', s.pos);
    if (end == std::string::npos) {
        line.assign(s.source, s.pos, std::string::npos);
        s.pos = s.source.size();
    } else {
        line.assign(s.source, s.pos, end - s.pos);
        s.pos = end + 1;
    }
    return true;
}

}  // namespace internal

std::string
effdiff::to_string(ReadStatus status) {
    switch (status) {
        case ReadStatus::kOk:
            return "Success";
        case ReadStatus::kFileNotFound:
            return "File not found";
        case ReadStatus::kIOError:
            return "I/O error";
    }
    return "Unknown error";
}

bool
effdiff::parselines(const std::string& input_text, std::vector<Line>& lines) {
    lines.clear();
    internal::LineParserState state{input_text};

    std::string line;
    int64_t i = 1;
    while (internal::getline(state, line)) {
        uint32_t hash = hash::hash(line.c_str(), line.size());
        lines.push_back({i, hash, std::move(line)});
        line = std::string{};
        i++;
    }

    return true;
}

effdiff::ReadStatus
effdiff::readfile(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        return errno == ENOENT ? ReadStatus::kFileNotFound : ReadStatus::kIOError;
    }

    char buffer[64 * 1024];
    std::size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, count);
    }

    const bool failed = ferror(stream) != 0;
    fclose(stream);
    return failed ? ReadStatus::kIOError : ReadStatus::kOk;
}

std::string
effdiff::joinlines(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line;
        text += '\n';
    }
    return text;
}
