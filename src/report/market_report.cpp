#include "report/market_report.hpp"

namespace gbce {

MarketReport build_report(const Exchange& exchange, Pennies quote_price, Window window) {
    MarketReport report{
        .quote_price = quote_price,
        .window = window,
        .stocks = {},
        .all_share_index = std::nullopt
    };

    for (const auto& symbol : exchange.symbols()) {
        const Stock& stock = exchange.get_stock(symbol);
        report.stocks.push_back(StockMetrics{
            .symbol = symbol,
            .kind = stock.kind(),
            .dividend_yield = stock.dividend_yield(quote_price),
            .pe_ratio = stock.pe_ratio(quote_price),
            .vwsp = stock.volume_weighted_stock_price(window),
            .trade_count = stock.trade_count()
        });
    }

    report.all_share_index = exchange.all_share_index(window);
    return report;
}

}  // namespace gbce
