#include <benchmark/benchmark.h>
#include "core/clock.hpp"
#include "exchange/exchange.hpp"
#include "trade/vwsp_calculator.hpp"
#include <chrono>
#include <cstdint>
#include <string>

using namespace gbce;

namespace {

const Timestamp kStart{std::chrono::hours(480000)};

}  // namespace

// Benchmark recording a single trade
static void BM_RecordTrade(benchmark::State& state) {
    ManualClock clock{kStart};
    Exchange exchange{clock};
    auto& stock = exchange.create_common_stock("TEA", 0, 10000);

    Pennies price = 9550;
    for (auto _ : state) {
        benchmark::DoNotOptimize(stock.record_trade(100, TradeIndicator::Buy, price));
        price = price == 10230 ? 9550 : price + 1;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RecordTrade);

// Benchmark the accumulator alone
static void BM_VwspCalculatorAdd(benchmark::State& state) {
    VwspCalculator calc;
    Trade trade{.timestamp = kStart, .quantity = 100, .indicator = TradeIndicator::Buy,
                .price = 9550};

    for (auto _ : state) {
        calc.add_trade(trade);
    }
    benchmark::DoNotOptimize(calc.vwsp());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VwspCalculatorAdd);

// Benchmark VWSP over a ledger of the given size
static void BM_StockVwsp(benchmark::State& state) {
    ManualClock clock{kStart};
    Exchange exchange{clock};
    auto& stock = exchange.create_common_stock("TEA", 0, 10000);

    for (std::int64_t i = 0; i < state.range(0); ++i) {
        stock.record_trade(1 + i % 50, TradeIndicator::Sell, 9000 + i % 2000);
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(stock.volume_weighted_stock_price());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_StockVwsp)->Range(8, 8 << 10)->Complexity();

// Benchmark VWSP when most of the ledger is outside the window
static void BM_StockVwspMostlyExpired(benchmark::State& state) {
    ManualClock clock{kStart};
    Exchange exchange{clock};
    auto& stock = exchange.create_common_stock("TEA", 0, 10000);

    for (int i = 0; i < 4096; ++i) {
        stock.record_trade(10, TradeIndicator::Buy, 10000 + i);
        clock.advance(std::chrono::seconds(1));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(stock.volume_weighted_stock_price());
    }
}
BENCHMARK(BM_StockVwspMostlyExpired);

// Benchmark the All-Share Index over the given number of traded stocks
static void BM_AllShareIndex(benchmark::State& state) {
    ManualClock clock{kStart};
    Exchange exchange{clock};

    for (std::int64_t i = 0; i < state.range(0); ++i) {
        auto& stock = exchange.create_common_stock("S" + std::to_string(i), 5, 10000);
        for (int t = 0; t < 10; ++t) {
            stock.record_trade(100 + t, TradeIndicator::Buy, 5000 + i * 10 + t);
        }
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(exchange.all_share_index());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_AllShareIndex)->Range(1, 1024)->Complexity();

BENCHMARK_MAIN();
