#include "vb/optimize/NumberFormat.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace vb {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Length of the number token at s[i], 0 if none.
// Grammar: [+-]? (digits [. digits?] | . digits) ([eE] [+-]? digits)?
std::size_t scanNumber(const std::string& s, std::size_t i) {
  std::size_t j = i;
  if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;

  std::size_t intDigits = 0, fracDigits = 0;
  while (j < s.size() && isDigit(s[j])) { ++j; ++intDigits; }
  if (j < s.size() && s[j] == '.') {
    std::size_t k = j + 1;
    while (k < s.size() && isDigit(s[k])) { ++k; ++fracDigits; }
    if (intDigits > 0 || fracDigits > 0) j = k;
  }
  if (intDigits == 0 && fracDigits == 0) return 0;

  if (j < s.size() && (s[j] == 'e' || s[j] == 'E')) {
    std::size_t k = j + 1;
    if (k < s.size() && (s[k] == '+' || s[k] == '-')) ++k;
    if (k < s.size() && isDigit(s[k])) {
      while (k < s.size() && isDigit(s[k])) ++k;
      j = k;
    }
  }
  return j - i;
}

} // namespace

bool parseNumber(const std::string& s, double& out) {
  if (s.empty() || scanNumber(s, 0) != s.size()) return false;
  out = std::strtod(s.c_str(), nullptr);
  return std::isfinite(out);
}

std::string roundNumber(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals < 0 ? 0 : decimals, v);
  std::string s(buf);

  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  if (s == "-0") s = "0";
  return s;
}

std::string roundNumbersIn(const std::string& value, int decimals) {
  std::string out;
  out.reserve(value.size());

  std::size_t i = 0;
  while (i < value.size()) {
    const char c = value[i];
    const bool startsToken = isDigit(c) || c == '.' || c == '+' || c == '-';
    const std::size_t n = startsToken ? scanNumber(value, i) : 0;
    if (n == 0) {
      out += c;
      ++i;
      continue;
    }

    const std::string token = value.substr(i, n);
    const double v = std::strtod(token.c_str(), nullptr);
    std::string rounded = std::isfinite(v) ? roundNumber(v, decimals) : token;
    // Fixed notation expands large exponents ("1e30"); never grow a token.
    if (rounded.size() > token.size()) rounded = token;
    // "1.5.5" and "1-0.001" rely on the '.' or sign as separator; keep one.
    if (!out.empty() && (isDigit(out.back()) || out.back() == '.') &&
        (isDigit(rounded[0]) || rounded[0] == '.')) {
      out += ' ';
    }
    out += rounded;
    i += n;
  }
  return out;
}

} // namespace vb
