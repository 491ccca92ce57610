#include "stock/preferred_stock.hpp"
#include "core/errors.hpp"
#include <utility>

namespace gbce {

PreferredStock::PreferredStock(Symbol symbol, Pennies last_dividend, Rate fixed_dividend_rate,
                               Pennies par_value, const Clock& clock)
    : Stock(std::move(symbol), last_dividend, par_value, clock)
    , fixed_dividend_rate_(fixed_dividend_rate)
{
    if (!fixed_dividend_rate_.is_positive() || fixed_dividend_rate_ > Rate::one()) {
        throw InvalidStock("Fixed dividend must be in (0, 1] for " + this->symbol() +
                           ", got " + fixed_dividend_rate_.to_string());
    }
}

Ratio PreferredStock::dividend() const {
    return Ratio(detail::BigInt(detail::BigInt(fixed_dividend_rate_.raw()) * par_value()),
                 detail::BigInt(Rate::scale));
}

}  // namespace gbce
