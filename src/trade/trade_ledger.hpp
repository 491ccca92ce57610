#pragma once

#include "core/clock.hpp"
#include "trade/trade.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace gbce {

/// Append-only, insertion-ordered log of one stock's trades
/// Appends and snapshots are serialized per ledger
class TradeLedger {
public:
    /// @param clock Timestamp source; must outlive the ledger
    explicit TradeLedger(const Clock& clock);

    TradeLedger(const TradeLedger&) = delete;
    TradeLedger& operator=(const TradeLedger&) = delete;

    /// Append a trade stamped with clock.now()
    /// @throws InvalidTrade if quantity <= 0, or price is not in (0, kMaxPennies]
    /// @return The recorded trade
    Trade record(Quantity quantity, TradeIndicator indicator, Pennies price);

    /// Trades with timestamp >= now() - window, in insertion order
    [[nodiscard]] std::vector<Trade> trades_since(Window window) const;

    /// Number of trades ever recorded
    [[nodiscard]] std::size_t size() const;

private:
    const Clock& clock_;
    mutable std::mutex mutex_;
    std::vector<Trade> trades_;
};

}  // namespace gbce
