#pragma once

#include "core/types.hpp"
#include "trade/trade.hpp"
#include <optional>

namespace gbce {

/// Volume-weighted stock price accumulator
/// Sums are exact; the result is rounded once, when read
class VwspCalculator {
public:
    VwspCalculator() = default;

    /// Add one trade's price and quantity to the running sums
    void add_trade(const Trade& trade);

    /// sum(quantity * price) / sum(quantity), in pounds, rounded half-up
    /// @return nullopt if nothing was added or total quantity is zero
    [[nodiscard]] std::optional<Amount> vwsp() const;

private:
    detail::BigInt sum_pq_{0};  // pennies * shares
    detail::BigInt sum_q_{0};
};

}  // namespace gbce
