#pragma once

#include "stock/stock.hpp"

namespace gbce {

/// Common stock: pays whatever was last declared
class CommonStock final : public Stock {
public:
    /// @throws InvalidStock on invalid parameters
    CommonStock(Symbol symbol, Pennies last_dividend, Pennies par_value,
                const Clock& clock = SystemClock::instance());

    [[nodiscard]] StockKind kind() const noexcept override { return StockKind::Common; }

    /// The last dividend
    [[nodiscard]] Ratio dividend() const override;
};

}  // namespace gbce
