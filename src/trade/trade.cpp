#include "trade/trade.hpp"
#include <cctype>
#include <string>

namespace gbce {

std::optional<TradeIndicator> parse_indicator(std::string_view text) {
    std::string upper(text);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == to_string(TradeIndicator::Buy)) {
        return TradeIndicator::Buy;
    }
    if (upper == to_string(TradeIndicator::Sell)) {
        return TradeIndicator::Sell;
    }
    return std::nullopt;
}

}  // namespace gbce
