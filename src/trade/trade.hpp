#pragma once

#include "core/types.hpp"
#include <optional>
#include <string_view>

namespace gbce {

/// Immutable record of an executed trade
struct Trade {
    Timestamp timestamp{};
    Quantity quantity{0};
    TradeIndicator indicator{TradeIndicator::Buy};
    Pennies price{0};  // per share
};

/// Parse "BUY" / "SELL" (case-insensitive)
[[nodiscard]] std::optional<TradeIndicator> parse_indicator(std::string_view text);

}  // namespace gbce
