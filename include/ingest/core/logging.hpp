#pragma once

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace ingest {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Logs go to stderr so stdout stays free for the report and the repair
 * script. Safe to call more than once; the last call wins.
 */
void init_logging(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

} // namespace ingest
