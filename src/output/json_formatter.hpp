#pragma once

#include "report/market_report.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace gbce::output {

/// Formats reports as JSON
/// Amounts are emitted as decimal strings so no digits are lost to double
class JsonFormatter {
public:
    /// Format a full market report
    [[nodiscard]] static nlohmann::json format_report(const MarketReport& report);

    /// Format one stock's metrics
    [[nodiscard]] static nlohmann::json format_stock(const StockMetrics& metrics);

    /// Get ISO8601 timestamp string (UTC, milliseconds)
    [[nodiscard]] static std::string iso_timestamp(
        std::chrono::system_clock::time_point when = std::chrono::system_clock::now());
};

}  // namespace gbce::output
