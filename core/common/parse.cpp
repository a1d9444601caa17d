#include "common/parse.hpp"

#include <cstddef>
#include <stdexcept>

namespace ideodrift {

bool parseBool(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" ||
        value == "1" || value == "on" || value == "On" || value == "ON") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" ||
        value == "0" || value == "off" || value == "Off" || value == "OFF") {
        return false;
    }
    throw std::invalid_argument("not a boolean: " + value);
}

double parseDouble(const std::string& value) {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters in number: " + value);
    }
    return parsed;
}

uint64_t parseUnsigned(const std::string& value) {
    size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-') {
        throw std::invalid_argument("negative value: " + value);
    }
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters in integer: " + value);
    }
    return static_cast<uint64_t>(parsed);
}

} // namespace ideodrift
