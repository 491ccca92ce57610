#pragma once

#include "report/market_report.hpp"

namespace gbce::output {

/// Console output for market reports, through spdlog
class ConsoleLogger {
public:
    /// Log one line per stock, then the index
    void log_report(const MarketReport& report) const;

    /// Log one stock's metrics
    void log_stock(const StockMetrics& metrics) const;
};

}  // namespace gbce::output
