#include "trade/vwsp_calculator.hpp"

namespace gbce {

void VwspCalculator::add_trade(const Trade& trade) {
    sum_pq_ += detail::BigInt(trade.price) * trade.quantity;
    sum_q_ += trade.quantity;
}

std::optional<Amount> VwspCalculator::vwsp() const {
    if (sum_q_ == 0) {
        return std::nullopt;
    }
    // Average is in pennies; divide by 100 for pounds in the same step
    return Amount::from_ratio(sum_pq_, detail::BigInt(sum_q_ * kPenniesPerPound));
}

}  // namespace gbce
