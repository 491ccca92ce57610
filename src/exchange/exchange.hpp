#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "stock/common_stock.hpp"
#include "stock/preferred_stock.hpp"
#include "stock/stock.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace gbce {

/// Registry of listed stocks, keyed by symbol
/// Stocks are owned here and never removed, so returned references stay
/// valid for the exchange's lifetime
class Exchange {
public:
    /// @param clock Time source shared by every stock's ledger; must
    ///        outlive the exchange
    explicit Exchange(const Clock& clock = SystemClock::instance());

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    /// @throws DuplicateSymbol if the symbol is already listed
    /// @throws InvalidStock on invalid parameters
    CommonStock& create_common_stock(const Symbol& symbol, Pennies last_dividend,
                                     Pennies par_value);

    /// @throws DuplicateSymbol if the symbol is already listed
    /// @throws InvalidStock on invalid parameters
    PreferredStock& create_preferred_stock(const Symbol& symbol, Pennies last_dividend,
                                           Rate fixed_dividend_rate, Pennies par_value);

    /// @throws StockNotFound if the symbol is not listed
    [[nodiscard]] Stock& get_stock(const Symbol& symbol);
    [[nodiscard]] const Stock& get_stock(const Symbol& symbol) const;

    [[nodiscard]] bool contains(const Symbol& symbol) const;

    /// Listed symbols in ascending order
    [[nodiscard]] std::vector<Symbol> symbols() const;

    [[nodiscard]] std::size_t size() const;

    /// GBCE All-Share Index: geometric mean of every positive VWSP
    /// Computed as exp(mean(ln(vwsp))) so large or many prices cannot
    /// overflow; stocks without trades in the window are left out
    /// @return nullopt if no stock has a VWSP
    [[nodiscard]] std::optional<Amount> all_share_index(
        Window window = kDefaultVwspWindow) const;

private:
    template <typename T, typename... Args>
    T& emplace(const Symbol& symbol, Args&&... args);

    const Clock& clock_;
    mutable std::mutex mutex_;
    std::map<Symbol, std::unique_ptr<Stock>> stocks_;
};

/// List every configured stock on the exchange
/// @throws DuplicateSymbol or InvalidStock from the first bad listing
void list_stocks(Exchange& exchange, const std::vector<Listing>& listings);

}  // namespace gbce
