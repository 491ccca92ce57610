#include <gtest/gtest.h>
#include "core/clock.hpp"
#include "core/errors.hpp"
#include "exchange/exchange.hpp"
#include "feed/trade_tickets.hpp"
#include <cstdio>
#include <fstream>

using namespace gbce;

TEST(TradeTicketsTest, ParsesArray) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": 1000, "indicator": "BUY", "price": 9550},
        {"symbol": "GIN", "quantity": 5, "indicator": "sell", "price": 100}
    ])");

    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto& tickets = result.value();
    ASSERT_EQ(tickets.size(), 2u);

    EXPECT_EQ(tickets[0].symbol, "TEA");
    EXPECT_EQ(tickets[0].quantity, 1000);
    EXPECT_EQ(tickets[0].indicator, TradeIndicator::Buy);
    EXPECT_EQ(tickets[0].price, 9550);
    EXPECT_EQ(tickets[1].indicator, TradeIndicator::Sell);
}

TEST(TradeTicketsTest, EmptyArrayIsValid) {
    auto result = parse_trade_tickets("[]");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST(TradeTicketsTest, RejectsInvalidJson) {
    auto result = parse_trade_tickets("[{");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("parse"), std::string::npos);
}

TEST(TradeTicketsTest, RejectsNonArray) {
    auto result = parse_trade_tickets(R"({"symbol": "TEA"})");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("array"), std::string::npos);
}

TEST(TradeTicketsTest, ReportsIndexOfBadEntry) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": 1, "indicator": "BUY", "price": 1},
        {"symbol": "TEA", "indicator": "BUY", "price": 1}
    ])");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("trade #1"), std::string::npos);
}

TEST(TradeTicketsTest, RejectsUnknownIndicator) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": 1, "indicator": "HOLD", "price": 1}
    ])");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("HOLD"), std::string::npos);
}

TEST(TradeTicketsTest, RejectsNonObjectEntry) {
    auto result = parse_trade_tickets("[42]");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("trade #0"), std::string::npos);
}

TEST(TradeTicketsTest, RejectsFractionalQuantity) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": 1.9, "indicator": "BUY", "price": 95}
    ])");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("trade #0"), std::string::npos);
    EXPECT_NE(result.error().find("quantity must be an integer"), std::string::npos);
}

TEST(TradeTicketsTest, RejectsFractionalPrice) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": 1, "indicator": "BUY", "price": 95},
        {"symbol": "TEA", "quantity": 1, "indicator": "BUY", "price": 95.5}
    ])");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("trade #1"), std::string::npos);
    EXPECT_NE(result.error().find("price must be an integer"), std::string::npos);
}

TEST(TradeTicketsTest, RejectsWholeNumberWrittenAsFloat) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": 10.0, "indicator": "BUY", "price": 95}
    ])");

    EXPECT_TRUE(result.is_err());
}

TEST(TradeTicketsTest, RangeIsLeftToRecording) {
    auto result = parse_trade_tickets(R"([
        {"symbol": "TEA", "quantity": -1, "indicator": "BUY", "price": 0}
    ])");
    ASSERT_TRUE(result.is_ok());

    ManualClock clock;
    Exchange exchange{clock};
    exchange.create_common_stock("TEA", 0, 10000);
    EXPECT_THROW(record_trade_tickets(exchange, result.value()), InvalidTrade);
    EXPECT_EQ(exchange.get_stock("TEA").trade_count(), 0u);
}

TEST(TradeTicketsTest, LoadFromFile) {
    const std::string path = "test_trades_temp.json";
    {
        std::ofstream file(path);
        file << R"([{"symbol": "POP", "quantity": 3, "indicator": "BUY", "price": 250}])";
    }

    auto result = load_trade_tickets(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result.is_ok()) << result.error();
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].symbol, "POP");
}

TEST(TradeTicketsTest, LoadMissingFile) {
    auto result = load_trade_tickets("no_such_trades.json");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("Failed to open"), std::string::npos);
}

TEST(TradeTicketsTest, RecordsOnMatchingStocks) {
    ManualClock clock;
    Exchange exchange{clock};
    list_stocks(exchange, default_listings());

    record_trade_tickets(exchange, demo_trade_tickets());

    EXPECT_EQ(exchange.get_stock("TEA").trade_count(), 2u);
    EXPECT_EQ(exchange.get_stock("TEA").volume_weighted_stock_price()->to_string(), "100.03");
    EXPECT_EQ(exchange.get_stock("POP").trade_count(), 0u);
}

TEST(TradeTicketsTest, UnknownSymbolStopsRecording) {
    ManualClock clock;
    Exchange exchange{clock};
    exchange.create_common_stock("TEA", 0, 10000);

    std::vector<TradeTicket> tickets = {
        {.symbol = "TEA", .quantity = 1, .indicator = TradeIndicator::Buy, .price = 100},
        {.symbol = "XYZ", .quantity = 1, .indicator = TradeIndicator::Buy, .price = 100},
        {.symbol = "TEA", .quantity = 1, .indicator = TradeIndicator::Buy, .price = 100},
    };

    EXPECT_THROW(record_trade_tickets(exchange, tickets), StockNotFound);
    EXPECT_EQ(exchange.get_stock("TEA").trade_count(), 1u);
}
