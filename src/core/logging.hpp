#pragma once

#include <string>

namespace gbce {

/// Install the async "gbce" logger as spdlog's default
/// @param level spdlog level name ("trace", "debug", "info", "warn", ...);
///        unknown names fall back to info
/// @param to_stderr Log to stderr, leaving stdout for report output
void setup_logging(const std::string& level, bool to_stderr = false);

/// Flush and drop all loggers; call before exit
void shutdown_logging();

}  // namespace gbce
