#include "output/console_logger.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace gbce::output {

namespace {

constexpr const char* kUndefined = "n/a";

std::string amount_or_na(const std::optional<Amount>& amount) {
    return amount ? amount->to_string() : kUndefined;
}

}  // namespace

void ConsoleLogger::log_report(const MarketReport& report) const {
    spdlog::info("Quote price {} | VWSP window {}s",
                 convert::pennies_to_amount(report.quote_price).to_string(),
                 report.window.count());

    for (const auto& metrics : report.stocks) {
        log_stock(metrics);
    }

    spdlog::info("GBCE All-Share Index: {}", amount_or_na(report.all_share_index));
}

void ConsoleLogger::log_stock(const StockMetrics& metrics) const {
    std::string pe = metrics.pe_ratio ? convert::ratio_to_string<4>(*metrics.pe_ratio)
                                      : kUndefined;

    // Format: SYM (type) | YIELD: X% | P/E: X | VWSP: X | TRADES: X
    spdlog::info(
        "{:<10} ({}) | YIELD: {}% | P/E: {} | VWSP: {} | TRADES: {}",
        metrics.symbol,
        to_string(metrics.kind),
        metrics.dividend_yield.to_string(),
        pe,
        amount_or_na(metrics.vwsp),
        metrics.trade_count
    );
}

}  // namespace gbce::output
