#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace ironwatch {

// Case-insensitive (Unicode aware) substring test. An empty needle matches.
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// "0x046d", "046D" and "1133" are all accepted; nullopt on garbage or overflow.
std::optional<uint16_t> parseHexId(const std::string& text);

std::string toHex(uint16_t value, int width = 4);

}
