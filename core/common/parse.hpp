#pragma once

#include <cstdint>
#include <string>

namespace ideodrift {

// Strict text-to-value conversions shared by the YAML loader and the CLI.
// The whole string must be consumed. Malformed input throws
// std::invalid_argument, values that do not fit throw std::out_of_range.

bool parseBool(const std::string& value);
double parseDouble(const std::string& value);

/// Rejects a leading '-' rather than letting stoull wrap it around.
uint64_t parseUnsigned(const std::string& value);

} // namespace ideodrift
