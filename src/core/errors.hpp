#pragma once

#include <stdexcept>
#include <string>

namespace gbce {

/// Base of every failure raised by the metrics engine
class GbceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Stock parameters out of range (symbol, par value, dividend, fixed rate)
class InvalidStock : public GbceError {
public:
    using GbceError::GbceError;
};

/// Non-positive trade quantity or price; the ledger is left unchanged
class InvalidTrade : public GbceError {
public:
    using GbceError::GbceError;
};

/// Symbol already registered on the exchange
class DuplicateSymbol : public GbceError {
public:
    explicit DuplicateSymbol(const std::string& symbol)
        : GbceError("Stock " + symbol + " already exists")
        , symbol_(symbol)
    {}

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

/// Symbol not registered on the exchange
class StockNotFound : public GbceError {
public:
    explicit StockNotFound(const std::string& symbol)
        : GbceError("Stock " + symbol + " not found")
        , symbol_(symbol)
    {}

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

}  // namespace gbce
