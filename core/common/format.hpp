#pragma once

#include <string>

namespace ideodrift {

/// Fixed-point with the given number of decimals ("0.69000").
std::string formatFixed(double value, int decimals);

/// At most `digits` significant digits, trailing zeros dropped (printf %g).
std::string formatSignificant(double value, int digits);

/// Shortest decimal that reads back as the same double, with ".0" appended
/// to integral values so 1.0 prints as "1.0" rather than "1".
std::string formatAsGiven(double value);

} // namespace ideodrift
