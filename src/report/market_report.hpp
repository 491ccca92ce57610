#pragma once

#include "core/types.hpp"
#include "exchange/exchange.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace gbce {

/// The four metrics for one stock at a quote price
struct StockMetrics {
    Symbol symbol;
    StockKind kind{StockKind::Common};
    Amount dividend_yield{};
    std::optional<Ratio> pe_ratio;
    std::optional<Amount> vwsp;
    std::size_t trade_count{0};
};

/// Snapshot of the whole exchange
struct MarketReport {
    Pennies quote_price{0};
    Window window{kDefaultVwspWindow};
    std::vector<StockMetrics> stocks;  // ascending by symbol
    std::optional<Amount> all_share_index;
};

/// Compute every metric for every listed stock
/// Each stock is read under its own ledger lock; the report is not an
/// atomic snapshot across stocks
[[nodiscard]] MarketReport build_report(const Exchange& exchange, Pennies quote_price,
                                        Window window = kDefaultVwspWindow);

}  // namespace gbce
