#pragma once
#include <string>

namespace vb {

// Whole-string numeric parse ("1", "-2.50", ".5", "1e3"). No units.
bool parseNumber(const std::string& s, double& out);

// Round to `decimals` places and print without trailing zeros ("3.10" -> "3.1",
// "-0.0001" at 2 -> "0").
std::string roundNumber(double v, int decimals);

// Round every number token inside an attribute value (path data, point
// lists, transforms). Non-numeric characters are copied through; a token
// whose rounded form would be longer is kept as written.
std::string roundNumbersIn(const std::string& value, int decimals);

} // namespace vb
