#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gbce {

/// A stock to list on the exchange at startup
struct Listing {
    Symbol symbol;
    StockKind kind = StockKind::Common;
    Pennies last_dividend = 0;
    Rate fixed_dividend = Rate::zero();  // preferred only
    Pennies par_value = 0;
};

/// The GBCE sample stocks
[[nodiscard]] std::vector<Listing> default_listings();

/// Immutable configuration for gbce
struct Config {
    /// Market configuration
    struct Market {
        Window vwsp_window = kDefaultVwspWindow;
        std::vector<Listing> listings = default_listings();
    };

    /// Output configuration
    struct Output {
        Pennies quote_price = 10000;  // price used for yield and P/E
        bool json = false;
        std::string log_level = "info";
    };

    Market market;
    Output output;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace gbce
