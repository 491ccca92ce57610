#include "exchange/exchange.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <utility>

namespace gbce {

Exchange::Exchange(const Clock& clock)
    : clock_(clock)
{}

template <typename T, typename... Args>
T& Exchange::emplace(const Symbol& symbol, Args&&... args) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Duplicate check comes before parameter validation
    if (stocks_.count(symbol) != 0) {
        throw DuplicateSymbol(symbol);
    }

    auto stock = std::make_unique<T>(symbol, std::forward<Args>(args)..., clock_);
    T& ref = *stock;
    stocks_.emplace(symbol, std::move(stock));
    return ref;
}

CommonStock& Exchange::create_common_stock(const Symbol& symbol, Pennies last_dividend,
                                           Pennies par_value) {
    auto& stock = emplace<CommonStock>(symbol, last_dividend, par_value);
    spdlog::info("Listed common stock {} (last dividend {}, par {})", symbol,
                 convert::pennies_to_amount(last_dividend).to_string(),
                 convert::pennies_to_amount(par_value).to_string());
    return stock;
}

PreferredStock& Exchange::create_preferred_stock(const Symbol& symbol, Pennies last_dividend,
                                                 Rate fixed_dividend_rate, Pennies par_value) {
    auto& stock = emplace<PreferredStock>(symbol, last_dividend, fixed_dividend_rate, par_value);
    spdlog::info("Listed preferred stock {} (last dividend {}, fixed {}, par {})", symbol,
                 convert::pennies_to_amount(last_dividend).to_string(),
                 fixed_dividend_rate.to_string(),
                 convert::pennies_to_amount(par_value).to_string());
    return stock;
}

Stock& Exchange::get_stock(const Symbol& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stocks_.find(symbol);
    if (it == stocks_.end()) {
        throw StockNotFound(symbol);
    }
    return *it->second;
}

const Stock& Exchange::get_stock(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stocks_.find(symbol);
    if (it == stocks_.end()) {
        throw StockNotFound(symbol);
    }
    return *it->second;
}

bool Exchange::contains(const Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stocks_.count(symbol) != 0;
}

std::vector<Symbol> Exchange::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Symbol> result;
    result.reserve(stocks_.size());
    for (const auto& [symbol, stock] : stocks_) {
        result.push_back(symbol);
    }
    return result;
}

std::size_t Exchange::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stocks_.size();
}

std::optional<Amount> Exchange::all_share_index(Window window) const {
    std::lock_guard<std::mutex> lock(mutex_);

    double log_sum = 0.0;
    std::size_t count = 0;
    for (const auto& [symbol, stock] : stocks_) {
        auto vwsp = stock->volume_weighted_stock_price(window);
        if (!vwsp || !vwsp->is_positive()) {
            spdlog::debug("Index skips {}: no VWSP in window", symbol);
            continue;
        }
        log_sum += std::log(vwsp->to_double());
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return Amount::from_double(std::exp(log_sum / static_cast<double>(count)));
}

void list_stocks(Exchange& exchange, const std::vector<Listing>& listings) {
    for (const auto& listing : listings) {
        if (listing.kind == StockKind::Preferred) {
            exchange.create_preferred_stock(listing.symbol, listing.last_dividend,
                                            listing.fixed_dividend, listing.par_value);
        } else {
            exchange.create_common_stock(listing.symbol, listing.last_dividend,
                                         listing.par_value);
        }
    }
}

}  // namespace gbce
