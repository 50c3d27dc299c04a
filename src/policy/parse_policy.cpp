#include "csvmap/parse_policy.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>

namespace cm {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

// from_chars/fast_float take '-' but not '+'. Drop a '+' only when a digit
// (integers) or a non-sign (floats) follows, so "+-1" still fails.
static std::string_view strip_plus(std::string_view s, bool digit_required) {
  if (s.size() < 2 || s[0] != '+') return s;
  char next = s[1];
  if (digit_required ? !is_digit(next) : (next == '+' || next == '-')) return s;
  return s.substr(1);
}

static bool spells_infinity(std::string_view s) {
  if (!s.empty() && (s[0] == '-' || s[0] == '+')) s.remove_prefix(1);
  return !s.empty() && (s[0] == 'i' || s[0] == 'I');
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  for (const auto& t : bool_policy.true_tokens) {
    if (bool_policy.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : bool_policy.false_tokens) {
    if (bool_policy.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

template <class Int>
std::optional<Int> ParsePolicy::parse_int(std::string_view s) const {
  s = strip_plus(s, /*digit_required=*/true);
  if (s.empty()) return std::nullopt;
  Int out{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

template std::optional<signed char> ParsePolicy::parse_int<signed char>(std::string_view) const;
template std::optional<short>       ParsePolicy::parse_int<short>(std::string_view) const;
template std::optional<int>         ParsePolicy::parse_int<int>(std::string_view) const;
template std::optional<long>        ParsePolicy::parse_int<long>(std::string_view) const;
template std::optional<long long>   ParsePolicy::parse_int<long long>(std::string_view) const;

template <class Fp>
static std::optional<Fp> parse_fp(std::string_view s) {
  std::string_view body = strip_plus(s, /*digit_required=*/false);
  if (body.empty()) return std::nullopt;
  Fp out{};
  auto [ptr, ec] = fast_float::from_chars(body.data(), body.data() + body.size(), out);
  if (ptr != body.data() + body.size()) return std::nullopt;
  if (ec == std::errc::result_out_of_range) {
    // Underflow rounds to zero and is accepted; overflow is not.
    if (std::isinf(out)) return std::nullopt;
    return out;
  }
  if (ec != std::errc()) return std::nullopt;
  if (std::isinf(out) && !spells_infinity(body)) return std::nullopt;
  return out;
}

std::optional<double> ParsePolicy::parse_double(std::string_view s) const {
  return parse_fp<double>(s);
}

std::optional<float> ParsePolicy::parse_float(std::string_view s) const {
  return parse_fp<float>(s);
}

std::string ParsePolicy::format_bool(bool v) const {
  return v ? "true" : "false";
}

std::string ParsePolicy::format_int(long long v) const {
  return std::to_string(v);
}

std::string ParsePolicy::format_float(double v, bool single) const {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";

  char tmp[64];
  int n = (float_precision >= 0)
      ? std::snprintf(tmp, sizeof(tmp), "%.*f", float_precision, v)
      : std::snprintf(tmp, sizeof(tmp), single ? "%.9g" : "%.17g", v);
  if (n < 0) return {};
  if (static_cast<size_t>(n) < sizeof(tmp)) return std::string(tmp, static_cast<size_t>(n));

  // Large magnitudes in fixed notation exceed the stack buffer.
  std::string out(static_cast<size_t>(n) + 1, '\0');
  std::snprintf(out.data(), out.size(), "%.*f", float_precision, v);
  out.resize(static_cast<size_t>(n));
  return out;
}

}
