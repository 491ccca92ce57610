#include <gtest/gtest.h>
#include "core/clock.hpp"
#include "exchange/exchange.hpp"
#include "output/console_logger.hpp"
#include "output/json_formatter.hpp"
#include "report/market_report.hpp"
#include <chrono>

using namespace gbce;
using namespace std::chrono_literals;

class MarketReportTest : public ::testing::Test {
protected:
    ManualClock clock{Timestamp{std::chrono::hours(480000)}};
    Exchange exchange{clock};

    void SetUp() override {
        list_stocks(exchange, default_listings());
    }
};

// ============================================================================
// build_report Tests
// ============================================================================

TEST_F(MarketReportTest, CoversEveryStockInSymbolOrder) {
    auto report = build_report(exchange, 10000);

    ASSERT_EQ(report.stocks.size(), 5u);
    EXPECT_EQ(report.stocks[0].symbol, "ALE");
    EXPECT_EQ(report.stocks[1].symbol, "GIN");
    EXPECT_EQ(report.stocks[4].symbol, "TEA");
    EXPECT_EQ(report.quote_price, 10000);
    EXPECT_EQ(report.window, std::chrono::minutes(5));
}

TEST_F(MarketReportTest, NoTradesMeansNoVwspOrIndex) {
    auto report = build_report(exchange, 10000);

    for (const auto& metrics : report.stocks) {
        EXPECT_FALSE(metrics.vwsp.has_value()) << metrics.symbol;
        EXPECT_EQ(metrics.trade_count, 0u);
    }
    EXPECT_FALSE(report.all_share_index.has_value());
}

TEST_F(MarketReportTest, MetricsAtQuotePrice) {
    auto report = build_report(exchange, 10000);

    const auto& gin = report.stocks[1];
    EXPECT_EQ(gin.kind, StockKind::Preferred);
    EXPECT_EQ(gin.dividend_yield.to_string(), "2.00");
    ASSERT_TRUE(gin.pe_ratio.has_value());
    EXPECT_EQ(*gin.pe_ratio, Ratio(1250));

    const auto& tea = report.stocks[4];
    EXPECT_EQ(tea.dividend_yield.to_string(), "0.00");
    EXPECT_FALSE(tea.pe_ratio.has_value());
}

TEST_F(MarketReportTest, IncludesTradesAndIndex) {
    exchange.get_stock("TEA").record_trade(1000, TradeIndicator::Buy, 9550);
    exchange.get_stock("TEA").record_trade(2000, TradeIndicator::Sell, 10230);

    auto report = build_report(exchange, 10000);

    const auto& tea = report.stocks[4];
    ASSERT_TRUE(tea.vwsp.has_value());
    EXPECT_EQ(tea.vwsp->to_string(), "100.03");
    EXPECT_EQ(tea.trade_count, 2u);
    ASSERT_TRUE(report.all_share_index.has_value());
    EXPECT_EQ(report.all_share_index->to_string(), "100.03");
}

TEST_F(MarketReportTest, UsesGivenWindow) {
    exchange.get_stock("POP").record_trade(10, TradeIndicator::Buy, 500);
    clock.advance(10min);

    EXPECT_FALSE(build_report(exchange, 10000).stocks[3].vwsp.has_value());
    EXPECT_TRUE(build_report(exchange, 10000, 15min).stocks[3].vwsp.has_value());
}

// ============================================================================
// JsonFormatter Tests
// ============================================================================

TEST_F(MarketReportTest, JsonReportShape) {
    exchange.get_stock("TEA").record_trade(1000, TradeIndicator::Buy, 9550);
    exchange.get_stock("TEA").record_trade(2000, TradeIndicator::Sell, 10230);

    auto j = output::JsonFormatter::format_report(build_report(exchange, 10000));

    EXPECT_EQ(j["type"], "report");
    EXPECT_EQ(j["quotePrice"], "100.00");
    EXPECT_EQ(j["windowSeconds"], 300);
    EXPECT_EQ(j["index"], "100.03");
    ASSERT_TRUE(j["stocks"].is_array());
    ASSERT_EQ(j["stocks"].size(), 5u);
    EXPECT_TRUE(j.contains("timestamp"));
}

TEST_F(MarketReportTest, JsonStockFields) {
    auto report = build_report(exchange, 10000);
    auto gin = output::JsonFormatter::format_stock(report.stocks[1]);

    EXPECT_EQ(gin["symbol"], "GIN");
    EXPECT_EQ(gin["type"], "preferred");
    EXPECT_EQ(gin["dividendYield"], "2.00");
    EXPECT_EQ(gin["peRatio"], "1250.0000");
    EXPECT_TRUE(gin["vwsp"].is_null());
    EXPECT_EQ(gin["tradeCount"], 0);
}

TEST_F(MarketReportTest, JsonUndefinedValuesAreNull) {
    auto j = output::JsonFormatter::format_report(build_report(exchange, 10000));

    EXPECT_TRUE(j["index"].is_null());
    const auto& tea = j["stocks"][4];
    EXPECT_EQ(tea["symbol"], "TEA");
    EXPECT_TRUE(tea["peRatio"].is_null());
    EXPECT_EQ(tea["dividendYield"], "0.00");
}

TEST(JsonFormatterTest, IsoTimestamp) {
    using namespace std::chrono;
    // 2024-01-02T03:04:05.678Z
    system_clock::time_point when{seconds(1704164645) + milliseconds(678)};

    EXPECT_EQ(output::JsonFormatter::iso_timestamp(when), "2024-01-02T03:04:05.678Z");
}

// ============================================================================
// ConsoleLogger Tests
// ============================================================================

TEST_F(MarketReportTest, ConsoleLoggerHandlesUndefinedValues) {
    output::ConsoleLogger logger;
    auto report = build_report(exchange, 0);

    EXPECT_FALSE(report.stocks[3].pe_ratio.has_value());
    EXPECT_NO_THROW(logger.log_report(report));
}
