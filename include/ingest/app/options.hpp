#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest::app {

enum ExitCode : int {
    kExitOk = 0,
    kExitRunErrors = 1,  ///< Run completed but some entries failed or were rejected
    kExitUsage = 2       ///< Bad arguments, unreadable config or invalid directories
};

struct OrganizeOptions {
    std::filesystem::path source;
    std::filesystem::path destination;
    bool approve = false;
    bool move = false;
    bool help = false;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> report_path;
    std::optional<std::string> log_level;
};

struct RepairOptions {
    std::filesystem::path archive;
    bool help = false;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> log_level;
};

/// `args` excludes the program name. With -h/--help the positionals are not required.
Result<OrganizeOptions> parse_organize_args(const std::vector<std::string>& args);
Result<RepairOptions> parse_repair_args(const std::vector<std::string>& args);

std::string organize_usage();
std::string repair_usage();

/**
 * @brief Defaults, then the config file, then --log-level; installs logging
 */
Result<IngestConfig> resolve_config(const std::optional<std::filesystem::path>& config_path,
                                    const std::optional<std::string>& log_level);

/// Checks that `path` exists and is a directory; `role` names it in the message
Result<void> require_directory(const std::filesystem::path& path, const std::string& role);

} // namespace ingest::app
