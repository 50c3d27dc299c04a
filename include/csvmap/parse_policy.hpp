#pragma once
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace cm {

// Accepted boolean spellings. The default set is the canonical one:
// 1 t T TRUE true True / 0 f F FALSE false False.
struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"1","t","T","TRUE","true","True"};
  std::vector<std::string> false_tokens = {"0","f","F","FALSE","false","False"};
  bool case_sensitive = true;
};

// Scalar cell coercion, both directions.
struct ParsePolicy {
  BoolPolicy bool_policy;

  // Fractional digits written for floating fields. 0 renders every value as
  // an integer (3.7 -> "4"); negative selects round-trip "%.17g" / "%.9g".
  int float_precision = 0;

  // Boolean parse from the configured token sets.
  std::optional<bool> parse_bool(std::string_view s) const;

  // Base-10 signed integer, optional leading sign, must fit `Int`.
  // Instantiated for signed char, short, int, long, long long.
  template <class Int>
  std::optional<Int> parse_int(std::string_view s) const;

  // Decimal / exponential / inf / nan via fast_float. A finite literal that
  // overflows the target width fails. Hex literals ("0x1p-2") are rejected.
  std::optional<double> parse_double(std::string_view s) const;
  std::optional<float>  parse_float(std::string_view s) const;

  std::string format_bool(bool v) const;
  std::string format_int(long long v) const;
  // `single` picks the round-trip width used when float_precision < 0.
  std::string format_float(double v, bool single) const;
};

}
