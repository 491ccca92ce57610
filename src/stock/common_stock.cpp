#include "stock/common_stock.hpp"
#include <utility>

namespace gbce {

CommonStock::CommonStock(Symbol symbol, Pennies last_dividend, Pennies par_value,
                         const Clock& clock)
    : Stock(std::move(symbol), last_dividend, par_value, clock)
{}

Ratio CommonStock::dividend() const {
    return Ratio(last_dividend());
}

}  // namespace gbce
