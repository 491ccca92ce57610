#pragma once

#include "core/fixed_point.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace gbce {

// 2 decimal places: pounds and pence, and percentages to 1bp
constexpr int kAmountDecimals = 2;
constexpr int kRateDecimals = 6;

// Monetary inputs are whole pennies
using Pennies = std::int64_t;

// Share count
using Quantity = std::int64_t;

// Rounded metric value (yield percentage, VWSP and index in pounds)
using Amount = FixedPoint<kAmountDecimals>;

// Fraction such as a fixed dividend rate (0.02 == 2%)
using Rate = FixedPoint<kRateDecimals>;

// Exact rational, for ratios that are not currency amounts
using Ratio = boost::multiprecision::cpp_rational;

// Wall clock time of a trade
using Timestamp = std::chrono::system_clock::time_point;

// Trailing lookback for windowed metrics
using Window = std::chrono::seconds;

constexpr Window kDefaultVwspWindow = std::chrono::minutes(5);

// Stock ticker, 1-10 characters (UTF-8 code points)
using Symbol = std::string;

constexpr std::size_t kMaxSymbolLength = 10;

constexpr Pennies kPenniesPerPound = 100;

// Largest accepted price, par value or dividend (10 billion pounds)
// Keeps every rounded metric (yield, VWSP, index, P/E to 4 places) in int64
constexpr Pennies kMaxPennies = 1'000'000'000'000;

enum class TradeIndicator {
    Buy,
    Sell
};

enum class StockKind {
    Common,
    Preferred
};

[[nodiscard]] constexpr std::string_view to_string(TradeIndicator indicator) noexcept {
    return indicator == TradeIndicator::Buy ? "BUY" : "SELL";
}

[[nodiscard]] constexpr std::string_view to_string(StockKind kind) noexcept {
    return kind == StockKind::Common ? "common" : "preferred";
}

// Conversion utilities
namespace convert {

/// Express a whole-penny amount in pounds
[[nodiscard]] inline Amount pennies_to_amount(Pennies pennies) {
    return Amount::from_ratio(pennies, kPenniesPerPound);
}

/// Render a ratio with the given number of decimal places (half-up)
template <int Decimals = 4>
[[nodiscard]] std::string ratio_to_string(const Ratio& ratio) {
    return FixedPoint<Decimals>::from_ratio(numerator(ratio), denominator(ratio)).to_string();
}

}  // namespace convert

}  // namespace gbce
