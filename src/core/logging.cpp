#include "core/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gbce {

void setup_logging(const std::string& level, bool to_stderr) {
    // Initialize async logging to avoid blocking
    spdlog::init_thread_pool(8192, 1);

    spdlog::sink_ptr sink;
    if (to_stderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        "gbce",
        sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    // from_str maps unknown names to "off"
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
        spdlog::warn("Unknown log level '{}', using info", level);
    }
    spdlog::set_level(parsed);
}

void shutdown_logging() {
    spdlog::shutdown();
}

}  // namespace gbce
