#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace gbce {

class Exchange;

/// A trade to record, as read from a trade file
struct TradeTicket {
    Symbol symbol;
    Quantity quantity{0};
    TradeIndicator indicator{TradeIndicator::Buy};
    Pennies price{0};
};

/// Parse a JSON array of {"symbol", "quantity", "indicator", "price"}
/// Only structure is checked here; quantity and price ranges are
/// enforced when the trade is recorded
[[nodiscard]] Result<std::vector<TradeTicket>, std::string> parse_trade_tickets(
    const std::string& text);

/// Read and parse a trade file
[[nodiscard]] Result<std::vector<TradeTicket>, std::string> load_trade_tickets(
    const std::string& path);

/// Record tickets in order on the matching stocks
/// @throws StockNotFound or InvalidTrade at the first bad ticket; earlier
///         tickets stay recorded
void record_trade_tickets(Exchange& exchange, const std::vector<TradeTicket>& tickets);

/// The built-in demo session: two TEA trades
[[nodiscard]] std::vector<TradeTicket> demo_trade_tickets();

}  // namespace gbce
