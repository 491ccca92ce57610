#include "trade/trade_ledger.hpp"
#include "core/errors.hpp"

namespace gbce {

TradeLedger::TradeLedger(const Clock& clock)
    : clock_(clock)
{}

Trade TradeLedger::record(Quantity quantity, TradeIndicator indicator, Pennies price) {
    if (quantity <= 0) {
        throw InvalidTrade("Quantity must be positive, got " + std::to_string(quantity));
    }
    if (price <= 0 || price > kMaxPennies) {
        throw InvalidTrade("Price must be in (0, " + std::to_string(kMaxPennies) +
                           "], got " + std::to_string(price));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Stamped under the lock so insertion order follows the clock
    Trade trade{
        .timestamp = clock_.now(),
        .quantity = quantity,
        .indicator = indicator,
        .price = price
    };
    trades_.push_back(trade);
    return trade;
}

std::vector<Trade> TradeLedger::trades_since(Window window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp cutoff = clock_.now() - window;

    std::vector<Trade> result;
    for (const auto& t : trades_) {
        if (t.timestamp >= cutoff) {
            result.push_back(t);
        }
    }
    return result;
}

std::size_t TradeLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

}  // namespace gbce
