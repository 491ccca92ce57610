#include "stock/stock.hpp"
#include "core/errors.hpp"
#include "trade/vwsp_calculator.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace gbce {

namespace {

// Length in UTF-8 code points; continuation bytes are not counted
std::size_t symbol_length(const Symbol& symbol) {
    std::size_t length = 0;
    for (unsigned char c : symbol) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

Symbol validated_symbol(Symbol symbol) {
    const std::size_t length = symbol_length(symbol);
    if (length == 0 || length > kMaxSymbolLength) {
        throw InvalidStock("Symbol must be 1-" + std::to_string(kMaxSymbolLength) +
                           " characters, got '" + symbol + "'");
    }
    return symbol;
}

}  // namespace

Stock::Stock(Symbol symbol, Pennies last_dividend, Pennies par_value, const Clock& clock)
    : symbol_(validated_symbol(std::move(symbol)))
    , par_value_(par_value)
    , last_dividend_(last_dividend)
    , ledger_(clock)
{
    if (par_value_ <= 0 || par_value_ > kMaxPennies) {
        throw InvalidStock("Par value must be in (0, " + std::to_string(kMaxPennies) +
                           "] for " + symbol_);
    }
    if (last_dividend_ < 0 || last_dividend_ > kMaxPennies) {
        throw InvalidStock("Last dividend must be in [0, " + std::to_string(kMaxPennies) +
                           "] for " + symbol_);
    }
}

Amount Stock::dividend_yield(Pennies price) const {
    if (price <= 0) {
        return Amount::zero();
    }
    const Ratio per_share = dividend();
    return Amount::from_ratio(detail::BigInt(numerator(per_share) * 100),
                              detail::BigInt(denominator(per_share) * price));
}

std::optional<Ratio> Stock::pe_ratio(Pennies price) const {
    if (price <= 0 || last_dividend_ == 0) {
        return std::nullopt;
    }
    return Ratio(price, last_dividend_);
}

Trade Stock::record_trade(Quantity quantity, TradeIndicator indicator, Pennies price) {
    Trade trade = ledger_.record(quantity, indicator, price);
    spdlog::debug("Recorded {} trade: {} shares of {} @ {}",
                  to_string(indicator), quantity, symbol_,
                  convert::pennies_to_amount(price).to_string());
    return trade;
}

std::optional<Amount> Stock::volume_weighted_stock_price(Window window) const {
    VwspCalculator calc;
    for (const auto& trade : ledger_.trades_since(window)) {
        calc.add_trade(trade);
    }
    return calc.vwsp();
}

std::vector<Trade> Stock::trades_since(Window window) const {
    return ledger_.trades_since(window);
}

std::size_t Stock::trade_count() const {
    return ledger_.size();
}

}  // namespace gbce
