#include "ingest/app/commands.hpp"

#include "ingest/app/options.hpp"
#include "ingest/core/config.hpp"
#include "ingest/repair/structure_repair.hpp"

#include <spdlog/spdlog.h>

namespace ingest::app {

int run_repair(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed = parse_repair_args(args);
    if (parsed.is_error()) {
        err << "Error: " << parsed.error() << "\n\n" << repair_usage();
        return kExitUsage;
    }
    const RepairOptions& options = parsed.value();
    if (options.help) {
        out << repair_usage();
        return kExitOk;
    }

    auto configured = resolve_config(options.config_path, options.log_level);
    if (configured.is_error()) {
        err << "Error: " << configured.error() << "\n";
        return kExitUsage;
    }
    const IngestConfig& config = configured.value();

    auto valid = require_directory(options.archive, "Archive directory");
    if (valid.is_error()) {
        err << "Error: " << valid.error() << "\n";
        return kExitUsage;
    }

    repair::StructureRepairPlanner planner(config);
    auto scanned = planner.scan(options.archive);
    if (scanned.is_error()) {
        err << "Error: " << scanned.error() << "\n";
        return kExitUsage;
    }
    const auto& script = scanned.value();

    if (!script.non_compliant_folders.empty()) {
        err << "Warning: Non-compliant folders found in root:\n";
        for (const auto& name : script.non_compliant_folders) {
            err << "  " << name << "\n";
        }
    }
    for (const auto& warning : script.warnings) {
        err << "Warning: " << warning << "\n";
    }

    if (script.managed_files == 0) {
        err << "# No " << config.family_name << " files found in archive directory.\n";
        return kExitOk;
    }
    if (script.moves.empty()) {
        err << "# All " << config.family_name << " files are already compliant.\n";
        return kExitOk;
    }

    spdlog::info("{} of {} managed files need to move", script.moves.size(), script.managed_files);
    err << "# " << script.moves.size() << " files to move\n";
    for (const auto& line : script.lines) {
        out << line << "\n";
    }
    return kExitOk;
}

} // namespace ingest::app
