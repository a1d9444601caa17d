#include "common/format.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace ideodrift {

std::string formatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

std::string formatSignificant(double value, int digits) {
    std::ostringstream ss;
    ss << std::setprecision(digits) << value;
    return ss.str();
}

std::string formatAsGiven(double value) {
    std::string text;
    for (int precision = 1; precision <= 17; precision++) {
        text = formatSignificant(value, precision);
        if (std::strtod(text.c_str(), nullptr) == value) break;
    }
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace ideodrift
