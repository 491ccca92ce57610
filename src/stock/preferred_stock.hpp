#pragma once

#include "stock/stock.hpp"

namespace gbce {

/// Preferred stock: pays a fixed fraction of par value
class PreferredStock final : public Stock {
public:
    /// @param fixed_dividend_rate Fraction of par, in (0, 1]
    /// @throws InvalidStock on invalid parameters
    PreferredStock(Symbol symbol, Pennies last_dividend, Rate fixed_dividend_rate,
                   Pennies par_value, const Clock& clock = SystemClock::instance());

    [[nodiscard]] StockKind kind() const noexcept override { return StockKind::Preferred; }

    [[nodiscard]] Rate fixed_dividend_rate() const noexcept { return fixed_dividend_rate_; }

    /// fixed_dividend_rate * par_value
    [[nodiscard]] Ratio dividend() const override;

private:
    Rate fixed_dividend_rate_;
};

}  // namespace gbce
