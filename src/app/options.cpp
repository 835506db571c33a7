#include "ingest/app/options.hpp"

#include "ingest/core/logging.hpp"

#include <system_error>

namespace ingest::app {
namespace fs = std::filesystem;

namespace {

// Reads the value of an option that takes one argument
Result<std::string> take_value(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        return Err<std::string>("Option " + args[i] + " requires a value");
    }
    return Ok(args[++i]);
}

} // namespace

Result<OrganizeOptions> parse_organize_args(const std::vector<std::string>& args) {
    OrganizeOptions options;
    std::vector<std::string> positionals;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--approve") {
            options.approve = true;
        } else if (arg == "--move") {
            options.move = true;
        } else if (arg == "--config" || arg == "--report" || arg == "--log-level") {
            auto value = take_value(args, i);
            if (value.is_error()) {
                return Err<OrganizeOptions>(value.error());
            }
            if (arg == "--config") {
                options.config_path = fs::path(value.value());
            } else if (arg == "--report") {
                options.report_path = fs::path(value.value());
            } else {
                options.log_level = value.value();
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Err<OrganizeOptions>("Unknown option: " + arg);
        } else {
            positionals.push_back(arg);
        }
    }

    if (options.help) {
        return Ok(options);
    }
    if (positionals.size() != 2) {
        return Err<OrganizeOptions>("Expected <source_dir> and <destination_dir>, got " +
                                    std::to_string(positionals.size()) + " arguments");
    }
    options.source = positionals[0];
    options.destination = positionals[1];
    return Ok(options);
}

Result<RepairOptions> parse_repair_args(const std::vector<std::string>& args) {
    RepairOptions options;
    std::vector<std::string> positionals;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config" || arg == "--log-level") {
            auto value = take_value(args, i);
            if (value.is_error()) {
                return Err<RepairOptions>(value.error());
            }
            if (arg == "--config") {
                options.config_path = fs::path(value.value());
            } else {
                options.log_level = value.value();
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Err<RepairOptions>("Unknown option: " + arg);
        } else {
            positionals.push_back(arg);
        }
    }

    if (options.help) {
        return Ok(options);
    }
    if (positionals.size() != 1) {
        return Err<RepairOptions>("Expected <archive_dir>, got " + std::to_string(positionals.size()) +
                                  " arguments");
    }
    options.archive = positionals[0];
    return Ok(options);
}

std::string organize_usage() {
    return "Usage: organize <source_dir> <destination_dir> [options]\n"
           "\n"
           "Sorts camera files from a card dump into dated archive folders.\n"
           "Without --approve nothing is written; the plan is only printed.\n"
           "\n"
           "Options:\n"
           "  --approve            Perform the planned copies\n"
           "  --move               Move instead of copy\n"
           "  --config <file>      JSON configuration file\n"
           "  --report <file>      Write the plan and summary as JSON\n"
           "  --log-level <level>  trace, debug, info, warn, error or off\n"
           "  -h, --help           Show this help\n";
}

std::string repair_usage() {
    return "Usage: repair_structure <archive_dir> [options]\n"
           "\n"
           "Prints a shell script that moves camera files inside dated folders\n"
           "into their managed subfolder. The script is written to stdout and\n"
           "never executed.\n"
           "\n"
           "Options:\n"
           "  --config <file>      JSON configuration file\n"
           "  --log-level <level>  trace, debug, info, warn, error or off\n"
           "  -h, --help           Show this help\n";
}

Result<IngestConfig> resolve_config(const std::optional<fs::path>& config_path,
                                    const std::optional<std::string>& log_level) {
    IngestConfig config;
    if (config_path) {
        auto loaded = load_config(*config_path);
        if (loaded.is_error()) {
            return loaded;
        }
        config = loaded.value();
    }
    if (log_level) {
        config.log_level = *log_level;
    }

    auto level = parse_log_level(config.log_level);
    if (!level) {
        return Err<IngestConfig>("Unknown log level: " + config.log_level);
    }
    init_logging(*level);
    return Ok(config);
}

Result<void> require_directory(const fs::path& path, const std::string& role) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Err<void>(role + " does not exist: " + path.string());
    }
    if (!fs::is_directory(status)) {
        return Err<void>(role + " is not a directory: " + path.string());
    }
    return Ok();
}

} // namespace ingest::app
