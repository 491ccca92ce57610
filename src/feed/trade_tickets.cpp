#include "feed/trade_tickets.hpp"
#include "exchange/exchange.hpp"
#include "trade/trade.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace gbce {

using json = nlohmann::json;

namespace {

using TicketsResult = Result<std::vector<TradeTicket>, std::string>;

}  // namespace

TicketsResult parse_trade_tickets(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return TicketsResult::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    if (!j.is_array()) {
        return TicketsResult::Err("Trade file must contain a JSON array");
    }

    std::vector<TradeTicket> tickets;
    tickets.reserve(j.size());

    for (std::size_t i = 0; i < j.size(); ++i) {
        const auto& entry = j[i];
        const std::string where = "trade #" + std::to_string(i) + ": ";

        if (!entry.is_object()) {
            return TicketsResult::Err(where + "expected an object");
        }

        try {
            TradeTicket ticket;
            ticket.symbol = entry.at("symbol").get<std::string>();

            // get<> would truncate a float, so insist on whole numbers
            const auto& quantity = entry.at("quantity");
            if (!quantity.is_number_integer()) {
                return TicketsResult::Err(where + "quantity must be an integer");
            }
            ticket.quantity = quantity.get<Quantity>();

            const auto& price = entry.at("price");
            if (!price.is_number_integer()) {
                return TicketsResult::Err(where + "price must be an integer");
            }
            ticket.price = price.get<Pennies>();

            const auto indicator_text = entry.at("indicator").get<std::string>();
            auto indicator = parse_indicator(indicator_text);
            if (!indicator) {
                return TicketsResult::Err(where + "unknown indicator '" + indicator_text + "'");
            }
            ticket.indicator = *indicator;

            tickets.push_back(std::move(ticket));
        } catch (const json::exception& e) {
            return TicketsResult::Err(where + e.what());
        }
    }

    return TicketsResult::Ok(std::move(tickets));
}

TicketsResult load_trade_tickets(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TicketsResult::Err("Failed to open trade file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_trade_tickets(buffer.str());
}

void record_trade_tickets(Exchange& exchange, const std::vector<TradeTicket>& tickets) {
    for (const auto& ticket : tickets) {
        exchange.get_stock(ticket.symbol)
            .record_trade(ticket.quantity, ticket.indicator, ticket.price);
    }
}

std::vector<TradeTicket> demo_trade_tickets() {
    return {
        {.symbol = "TEA", .quantity = 1000, .indicator = TradeIndicator::Buy, .price = 9550},
        {.symbol = "TEA", .quantity = 2000, .indicator = TradeIndicator::Sell, .price = 10230},
    };
}

}  // namespace gbce
