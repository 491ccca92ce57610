#include "output/json_formatter.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gbce::output {

namespace {

nlohmann::json amount_or_null(const std::optional<Amount>& amount) {
    if (!amount) {
        return nullptr;
    }
    return amount->to_string();
}

}  // namespace

nlohmann::json JsonFormatter::format_report(const MarketReport& report) {
    auto stocks = nlohmann::json::array();
    for (const auto& metrics : report.stocks) {
        stocks.push_back(format_stock(metrics));
    }

    return nlohmann::json{
        {"type", "report"},
        {"timestamp", iso_timestamp()},
        {"quotePrice", convert::pennies_to_amount(report.quote_price).to_string()},
        {"windowSeconds", report.window.count()},
        {"index", amount_or_null(report.all_share_index)},
        {"stocks", stocks}
    };
}

nlohmann::json JsonFormatter::format_stock(const StockMetrics& metrics) {
    nlohmann::json pe = nullptr;
    if (metrics.pe_ratio) {
        pe = convert::ratio_to_string<4>(*metrics.pe_ratio);
    }

    return nlohmann::json{
        {"symbol", metrics.symbol},
        {"type", std::string(to_string(metrics.kind))},
        {"dividendYield", metrics.dividend_yield.to_string()},
        {"peRatio", pe},
        {"vwsp", amount_or_null(metrics.vwsp)},
        {"tradeCount", metrics.trade_count}
    };
}

std::string JsonFormatter::iso_timestamp(std::chrono::system_clock::time_point when) {
    auto time_t_now = std::chrono::system_clock::to_time_t(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()
    ) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace gbce::output
