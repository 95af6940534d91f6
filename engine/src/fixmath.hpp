#pragma once

#include <cstdint>
#include <limits>
#include <string>

// Decimal fixed-point with 9 fractional digits. Rates, prices, fractions and
// volumes inside the engine are all carried as Fix.
using Fix = int64_t;

namespace fixmath {

constexpr Fix FIX_ZERO = 0;
constexpr Fix FIX_ONE = 1000000000;
constexpr Fix FIX_MAX = std::numeric_limits<int64_t>::max();
constexpr int FIX_DECIMALS = 9;

enum class Rounding {
    Floor,
    Round,
    Ceil
};

// Nearest representable value
Fix from_double(double value);
double to_double(Fix value);

// Exact decimal parse ("1.05", "-0.5", "3"). Throws std::invalid_argument
// on malformed input or more than 9 fractional digits.
Fix from_string(const std::string& text);
std::string to_string(Fix value);

Fix from_int(int64_t value);

// a * b and a / b. Throw std::overflow_error when the result does not fit,
// div throws std::domain_error on a zero divisor.
Fix mul(Fix a, Fix b, Rounding rounding = Rounding::Floor);
Fix div(Fix a, Fix b, Rounding rounding = Rounding::Floor);

// a * num / den on plain integers, one rounding step
Fix mulu_divu(Fix a, int64_t num, int64_t den, Rounding rounding = Rounding::Floor);

Fix pow(Fix base, unsigned exponent, Rounding rounding = Rounding::Floor);

Fix abs_diff(Fix a, Fix b);

} // namespace fixmath
