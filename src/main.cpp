#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "exchange/exchange.hpp"
#include "feed/trade_tickets.hpp"
#include "output/console_logger.hpp"
#include "output/json_formatter.hpp"
#include "report/market_report.hpp"
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -t, --trades <path>  Record trades from JSON file (default: demo trades)\n"
              << "  -p, --price <pence>  Quote price for dividend yield and P/E\n"
              << "  -j, --json           Print the report as JSON\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  GBCE_VWSP_WINDOW_S   VWSP lookback window in seconds\n"
              << "  GBCE_QUOTE_PRICE     Quote price in pence\n"
              << "  GBCE_OUTPUT_JSON     1 for JSON output\n"
              << "  GBCE_LOG_LEVEL       trace, debug, info, warn, error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "gbce v1.0.0\n"
              << "Global Beverage Corporation Exchange stock metrics\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> trades_path;
    std::optional<gbce::Pennies> quote_price;
    bool json = false;
    bool show_help = false;
    bool show_version = false;
};

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "-j" || arg == "--json") {
            args.json = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-t" || arg == "--trades") && i + 1 < argc) {
            args.trades_path = argv[++i];
        } else if ((arg == "-p" || arg == "--price") && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                args.quote_price = std::stoll(value);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid price: " << value << std::endl;
                return std::nullopt;
            }
            if (*args.quote_price <= 0 || *args.quote_price > gbce::kMaxPennies) {
                std::cerr << "Price must be in (0, " << gbce::kMaxPennies << "]: "
                          << value << std::endl;
                return std::nullopt;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return 2;
    }

    if (args->show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args->show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = gbce::Config::load(args->config_path);

    if (args->quote_price) {
        config.output.quote_price = *args->quote_price;
    }
    if (args->json) {
        config.output.json = true;
    }

    gbce::setup_logging(config.output.log_level, config.output.json);

    int status = 0;
    try {
        gbce::Exchange exchange;
        gbce::list_stocks(exchange, config.market.listings);

        if (args->trades_path) {
            auto tickets = gbce::load_trade_tickets(*args->trades_path);
            if (tickets.is_err()) {
                spdlog::error("{}", tickets.error());
                gbce::shutdown_logging();
                return 1;
            }
            gbce::record_trade_tickets(exchange, tickets.value());
            spdlog::info("Recorded {} trades from {}", tickets.value().size(), *args->trades_path);
        } else {
            gbce::record_trade_tickets(exchange, gbce::demo_trade_tickets());
        }

        auto report = gbce::build_report(exchange, config.output.quote_price,
                                         config.market.vwsp_window);

        if (config.output.json) {
            std::cout << gbce::output::JsonFormatter::format_report(report).dump(2) << std::endl;
        } else {
            gbce::output::ConsoleLogger{}.log_report(report);
        }
    } catch (const gbce::GbceError& e) {
        spdlog::error("{}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        status = 1;
    }

    gbce::shutdown_logging();
    return status;
}
