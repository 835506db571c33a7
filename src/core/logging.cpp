#include "ingest/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ingest {

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("ingest");
    if (!logger) {
        logger = spdlog::stderr_color_mt("ingest");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    // from_str maps unknown names to off
    const auto level = spdlog::level::from_str(text);
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace ingest
