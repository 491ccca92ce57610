#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gbce {

namespace detail {

using BigInt = boost::multiprecision::cpp_int;

constexpr std::int64_t pow10(int exponent) noexcept {
    std::int64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

/// Divide, rounding half away from zero
/// @throws std::invalid_argument if den is zero
inline BigInt div_round_half_up(const BigInt& num, const BigInt& den) {
    if (den == 0) {
        throw std::invalid_argument("Division by zero");
    }

    BigInt quotient;
    BigInt remainder;
    boost::multiprecision::divide_qr(num, den, quotient, remainder);  // truncates toward zero

    BigInt twice_rem = remainder < 0 ? BigInt(-remainder) : remainder;
    twice_rem *= 2;
    const BigInt abs_den = den < 0 ? BigInt(-den) : den;

    if (twice_rem >= abs_den) {
        if ((num < 0) != (den < 0)) {
            quotient -= 1;
        } else {
            quotient += 1;
        }
    }
    return quotient;
}

/// Narrow to int64
/// @throws std::overflow_error if the value does not fit
inline std::int64_t narrow(const BigInt& value) {
    if (value > std::numeric_limits<std::int64_t>::max() ||
        value < std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("Value too large for fixed-point representation");
    }
    return value.convert_to<std::int64_t>();
}

}  // namespace detail

/// Fixed-point decimal type for monetary results
/// Uses int64_t internally; every conversion into it rounds half-up
/// (ties away from zero) and nothing else rounds
/// @tparam Decimals Number of decimal places (2 for pounds and percentages)
template <int Decimals>
class FixedPoint {
public:
    static_assert(Decimals >= 0 && Decimals <= 18,
                  "Decimals must be between 0 and 18");

    using underlying_type = std::int64_t;

    /// Scale factor (10^Decimals)
    static constexpr underlying_type scale = detail::pow10(Decimals);

    static constexpr int decimals = Decimals;

    /// Default constructor - zero value
    constexpr FixedPoint() noexcept : value_(0) {}

    /// Construct from raw underlying value (units of 10^-Decimals)
    static constexpr FixedPoint from_raw(underlying_type raw) noexcept {
        FixedPoint fp;
        fp.value_ = raw;
        return fp;
    }

    /// Exact quotient num / den rounded half-up to Decimals places
    /// @throws std::invalid_argument if den is zero
    /// @throws std::overflow_error if the result does not fit
    [[nodiscard]] static FixedPoint from_ratio(const detail::BigInt& num,
                                               const detail::BigInt& den) {
        detail::BigInt scaled = num * scale;
        return from_raw(detail::narrow(detail::div_round_half_up(scaled, den)));
    }

    /// Convert a double through its shortest decimal representation
    /// @throws std::invalid_argument for NaN or infinity
    [[nodiscard]] static FixedPoint from_double(double d) {
        if (!std::isfinite(d)) {
            throw std::invalid_argument("Cannot convert non-finite value");
        }
        // Fixed notation of DBL_MAX is 309 digits
        char buffer[400];
        auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), d,
                                       std::chars_format::fixed);
        if (ec != std::errc{}) {
            throw std::overflow_error("Value too large for fixed-point representation");
        }
        return parse(std::string_view(buffer, static_cast<std::size_t>(end - buffer)));
    }

    /// Get raw underlying value
    [[nodiscard]] constexpr underlying_type raw() const noexcept {
        return value_;
    }

    /// Convert to double (for display and logarithms only)
    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / static_cast<double>(scale);
    }

    /// Convert to string with exactly Decimals fractional digits
    [[nodiscard]] std::string to_string() const {
        bool negative = value_ < 0;
        // Widen before negating so INT64_MIN stays representable
        detail::BigInt abs_val = negative ? detail::BigInt(-detail::BigInt(value_))
                                          : detail::BigInt(value_);

        std::string result = detail::BigInt(abs_val / scale).str();

        if constexpr (Decimals > 0) {
            std::string frac_str = detail::BigInt(abs_val % scale).str();
            while (static_cast<int>(frac_str.length()) < Decimals) {
                frac_str = "0" + frac_str;
            }
            result += '.';
            result += frac_str;
        }

        if (negative) {
            result = "-" + result;
        }
        return result;
    }

    /// Parse from string, rounding extra fractional digits half-up
    /// @throws std::invalid_argument for invalid format
    /// @throws std::overflow_error if value is too large
    [[nodiscard]] static FixedPoint parse(std::string_view str) {
        if (str.empty()) {
            throw std::invalid_argument("Invalid number format: empty");
        }

        bool negative = false;
        std::size_t pos = 0;

        if (str[0] == '-') {
            negative = true;
            pos = 1;
        } else if (str[0] == '+') {
            pos = 1;
        }

        if (pos >= str.length()) {
            throw std::invalid_argument("Invalid number format: sign only");
        }

        detail::BigInt digits = 0;
        int frac_digits = 0;
        bool in_fraction = false;
        bool has_digits = false;
        bool round_up = false;

        for (; pos < str.length(); ++pos) {
            char c = str[pos];
            if (c == '.') {
                if (in_fraction) {
                    throw std::invalid_argument("Multiple decimal points");
                }
                in_fraction = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid character in number");
            }

            has_digits = true;
            int digit = c - '0';
            if (in_fraction && frac_digits >= Decimals) {
                // Only the first dropped digit decides half-up
                if (frac_digits == Decimals) {
                    round_up = digit >= 5;
                    ++frac_digits;
                }
                continue;
            }
            digits = digits * 10 + digit;
            if (in_fraction) {
                ++frac_digits;
            }
        }

        if (!has_digits) {
            throw std::invalid_argument("No digits found in number");
        }

        for (int i = frac_digits; i < Decimals; ++i) {
            digits *= 10;
        }
        if (round_up) {
            digits += 1;
        }
        if (negative) {
            digits = -digits;
        }

        return from_raw(detail::narrow(digits));
    }

    // Comparison operators
    [[nodiscard]] constexpr bool operator==(const FixedPoint& other) const noexcept {
        return value_ == other.value_;
    }

    [[nodiscard]] constexpr bool operator!=(const FixedPoint& other) const noexcept {
        return value_ != other.value_;
    }

    [[nodiscard]] constexpr bool operator<(const FixedPoint& other) const noexcept {
        return value_ < other.value_;
    }

    [[nodiscard]] constexpr bool operator<=(const FixedPoint& other) const noexcept {
        return value_ <= other.value_;
    }

    [[nodiscard]] constexpr bool operator>(const FixedPoint& other) const noexcept {
        return value_ > other.value_;
    }

    [[nodiscard]] constexpr bool operator>=(const FixedPoint& other) const noexcept {
        return value_ >= other.value_;
    }

    /// Check if value is zero
    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return value_ == 0;
    }

    /// Check if value is positive (> 0)
    [[nodiscard]] constexpr bool is_positive() const noexcept {
        return value_ > 0;
    }

    /// Zero constant
    static constexpr FixedPoint zero() noexcept {
        return FixedPoint{};
    }

    /// One constant
    static constexpr FixedPoint one() noexcept {
        return from_raw(scale);
    }

private:
    underlying_type value_;
};

/// Re-round a fixed-point value to another precision (half-up)
/// Exact when To >= From, so rounding twice to the same precision is a no-op
template <int To, int From>
[[nodiscard]] FixedPoint<To> rescale(FixedPoint<From> value) {
    return FixedPoint<To>::from_ratio(value.raw(), FixedPoint<From>::scale);
}

}  // namespace gbce
