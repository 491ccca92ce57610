#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include "trade/trade.hpp"
#include "trade/trade_ledger.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace gbce {

/// A listed stock: identity, dividend data and its own trade ledger
/// Variants differ only in how the per-share dividend is derived
class Stock {
public:
    virtual ~Stock() = default;

    Stock(const Stock&) = delete;
    Stock& operator=(const Stock&) = delete;

    [[nodiscard]] const Symbol& symbol() const noexcept { return symbol_; }
    [[nodiscard]] Pennies par_value() const noexcept { return par_value_; }
    [[nodiscard]] Pennies last_dividend() const noexcept { return last_dividend_; }

    [[nodiscard]] virtual StockKind kind() const noexcept = 0;

    /// Per-share dividend in pennies, exact
    [[nodiscard]] virtual Ratio dividend() const = 0;

    /// Dividend yield in percent: dividend * 100 / price
    /// @return 0.00 if price <= 0
    [[nodiscard]] Amount dividend_yield(Pennies price) const;

    /// Price / last dividend, unrounded
    /// @return nullopt if price <= 0 or last dividend is zero
    [[nodiscard]] std::optional<Ratio> pe_ratio(Pennies price) const;

    /// Record a trade at the clock's current time
    /// @throws InvalidTrade if quantity <= 0, or price is not in (0, kMaxPennies]
    Trade record_trade(Quantity quantity, TradeIndicator indicator, Pennies price);

    /// Volume-weighted price, in pounds, of trades within the window
    /// @return nullopt if no trade falls within the window
    [[nodiscard]] std::optional<Amount> volume_weighted_stock_price(
        Window window = kDefaultVwspWindow) const;

    [[nodiscard]] std::vector<Trade> trades_since(Window window) const;

    [[nodiscard]] std::size_t trade_count() const;

protected:
    /// @throws InvalidStock on a bad symbol, or a par value or last dividend
    ///         outside its range (at most kMaxPennies)
    Stock(Symbol symbol, Pennies last_dividend, Pennies par_value, const Clock& clock);

private:
    Symbol symbol_;
    Pennies par_value_;
    Pennies last_dividend_;
    TradeLedger ledger_;
};

}  // namespace gbce
