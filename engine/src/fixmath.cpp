#include "fixmath.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace fixmath {

namespace {

using wide = __int128;

Fix narrow(wide value) {
    if (value > static_cast<wide>(std::numeric_limits<int64_t>::max()) ||
        value < static_cast<wide>(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error("fixed-point overflow");
    }
    return static_cast<Fix>(value);
}

// Integer division of num by den (den > 0) with the requested rounding
wide divide(wide num, wide den, Rounding rounding) {
    if (den < 0) {
        num = -num;
        den = -den;
    }
    wide q = num / den;
    wide r = num % den;
    if (r == 0) return q;

    switch (rounding) {
        case Rounding::Floor:
            if (num < 0) q -= 1;
            break;
        case Rounding::Ceil:
            if (num > 0) q += 1;
            break;
        case Rounding::Round: {
            wide twice = (r < 0 ? -r : r) * 2;
            if (twice >= den) q += (num < 0 ? -1 : 1);
            break;
        }
    }
    return q;
}

} // namespace

Fix from_double(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("cannot convert non-finite value to fixed-point");
    }
    double scaled = std::round(value * static_cast<double>(FIX_ONE));
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw std::overflow_error("fixed-point overflow");
    }
    return static_cast<Fix>(scaled);
}

double to_double(Fix value) {
    return static_cast<double>(value) / static_cast<double>(FIX_ONE);
}

Fix from_string(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        pos++;
    }

    wide whole = 0;
    wide frac = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool seen_dot = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) throw std::invalid_argument("malformed decimal: " + text);
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("malformed decimal: " + text);
        }
        seen_digit = true;
        if (seen_dot) {
            if (++frac_digits > FIX_DECIMALS) {
                throw std::invalid_argument("too many decimal places: " + text);
            }
            frac = frac * 10 + (c - '0');
        } else {
            whole = whole * 10 + (c - '0');
            if (whole > static_cast<wide>(FIX_MAX / FIX_ONE)) {
                throw std::overflow_error("fixed-point overflow: " + text);
            }
        }
    }
    if (!seen_digit) throw std::invalid_argument("malformed decimal: " + text);

    for (int i = frac_digits; i < FIX_DECIMALS; ++i) frac *= 10;

    wide value = whole * FIX_ONE + frac;
    return narrow(negative ? -value : value);
}

std::string to_string(Fix value) {
    bool negative = value < 0;
    wide v = value;
    if (negative) v = -v;

    auto whole = static_cast<uint64_t>(v / FIX_ONE);
    auto frac = static_cast<uint64_t>(v % FIX_ONE);

    std::string out = negative ? "-" : "";
    out += std::to_string(whole);
    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, FIX_DECIMALS - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return out;
}

Fix from_int(int64_t value) {
    return narrow(static_cast<wide>(value) * FIX_ONE);
}

Fix mul(Fix a, Fix b, Rounding rounding) {
    return narrow(divide(static_cast<wide>(a) * b, FIX_ONE, rounding));
}

Fix div(Fix a, Fix b, Rounding rounding) {
    if (b == 0) throw std::domain_error("fixed-point division by zero");
    return narrow(divide(static_cast<wide>(a) * FIX_ONE, b, rounding));
}

Fix mulu_divu(Fix a, int64_t num, int64_t den, Rounding rounding) {
    if (den == 0) throw std::domain_error("fixed-point division by zero");
    return narrow(divide(static_cast<wide>(a) * num, den, rounding));
}

Fix pow(Fix base, unsigned exponent, Rounding rounding) {
    Fix result = FIX_ONE;
    for (unsigned i = 0; i < exponent; ++i) {
        result = mul(result, base, rounding);
    }
    return result;
}

Fix abs_diff(Fix a, Fix b) {
    return a > b ? narrow(static_cast<wide>(a) - b) : narrow(static_cast<wide>(b) - a);
}

} // namespace fixmath
