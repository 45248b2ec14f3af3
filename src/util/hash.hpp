#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace effdiff::hash {

uint32_t
hash(const char* input, std::size_t len);
uint32_t
hash(std::string_view input);

}  // namespace effdiff::hash
