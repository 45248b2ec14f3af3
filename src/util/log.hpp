#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <utility>

namespace effdiff {

// Printed only when the caller has debug output enabled.
template <typename... Args>
void
log_debug(std::FILE* stream, bool enabled, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled) {
        return;
    }
    fmt::print(stream, "effdiff: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void
log_debug(bool enabled, fmt::format_string<Args...> format, Args&&... args) {
    log_debug(stderr, enabled, format, std::forward<Args>(args)...);
}

}  // namespace effdiff
