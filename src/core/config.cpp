#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace gbce {

using json = nlohmann::json;

std::vector<Listing> default_listings() {
    return {
        {.symbol = "TEA", .kind = StockKind::Common, .last_dividend = 0, .par_value = 10000},
        {.symbol = "POP", .kind = StockKind::Common, .last_dividend = 8, .par_value = 10000},
        {.symbol = "ALE", .kind = StockKind::Common, .last_dividend = 23, .par_value = 6000},
        {.symbol = "GIN", .kind = StockKind::Preferred, .last_dividend = 8,
         .fixed_dividend = Rate::parse("0.02"), .par_value = 10000},
        {.symbol = "JOE", .kind = StockKind::Common, .last_dividend = 13, .par_value = 25000},
    };
}

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<long long> get_env_int(const char* name,
                                     long long min_val = std::numeric_limits<long long>::min(),
                                     long long max_val = std::numeric_limits<long long>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::logic_error&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Window: 1 second to 1 day
    if (auto v = get_env_int("GBCE_VWSP_WINDOW_S", 1, 86400)) {
        config.market.vwsp_window = Window(*v);
    }
    if (auto v = get_env_int("GBCE_QUOTE_PRICE", 1, kMaxPennies)) {
        config.output.quote_price = static_cast<Pennies>(*v);
    }
    if (auto v = get_env_int("GBCE_OUTPUT_JSON", 0, 1)) {
        config.output.json = *v == 1;
    }
    if (auto v = get_env("GBCE_LOG_LEVEL")) {
        config.output.log_level = *v;
    }
}

Listing parse_listing(const json& j) {
    Listing listing;
    listing.symbol = j.at("symbol").get<std::string>();

    const auto type = j.value("type", std::string(to_string(StockKind::Common)));
    if (type == to_string(StockKind::Common)) {
        listing.kind = StockKind::Common;
    } else if (type == to_string(StockKind::Preferred)) {
        listing.kind = StockKind::Preferred;
    } else {
        throw std::invalid_argument("Unknown stock type '" + type + "' for " + listing.symbol);
    }

    listing.last_dividend = j.at("last_dividend").get<Pennies>();
    listing.par_value = j.at("par_value").get<Pennies>();

    if (listing.kind == StockKind::Preferred) {
        const auto& rate = j.at("fixed_dividend");
        listing.fixed_dividend = rate.is_string() ? Rate::parse(rate.get<std::string>())
                                                  : Rate::from_double(rate.get<double>());
    }
    return listing;
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    // Read file contents
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    // Parse JSON
    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    // Start with defaults
    Config config = Config::defaults();

    try {
        // Market section
        if (j.contains("market")) {
            const auto& market = j["market"];
            if (market.contains("vwsp_window_s")) {
                auto seconds = market["vwsp_window_s"].get<long long>();
                if (seconds <= 0) {
                    return Result<Config, std::string>::Err("vwsp_window_s must be positive");
                }
                config.market.vwsp_window = Window(seconds);
            }
            if (market.contains("listings")) {
                config.market.listings.clear();
                for (const auto& entry : market["listings"]) {
                    config.market.listings.push_back(parse_listing(entry));
                }
            }
        }

        // Output section
        if (j.contains("output")) {
            const auto& out = j["output"];
            if (out.contains("quote_price")) {
                auto price = out["quote_price"].get<Pennies>();
                if (!out["quote_price"].is_number_integer() || price <= 0 ||
                    price > kMaxPennies) {
                    return Result<Config, std::string>::Err(
                        "quote_price must be in (0, " + std::to_string(kMaxPennies) + "]");
                }
                config.output.quote_price = price;
            }
            if (out.contains("json")) {
                config.output.json = out["json"].get<bool>();
            }
            if (out.contains("log_level")) {
                config.output.log_level = out["log_level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return Result<Config, std::string>::Err("Error reading listing: " + std::string(e.what()));
    } catch (const std::overflow_error& e) {
        return Result<Config, std::string>::Err("Error reading listing: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    // Load from file if path provided
    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Apply environment variable overrides (highest priority)
    apply_env_overrides(config);

    return config;
}

}  // namespace gbce
