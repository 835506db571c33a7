#include "ingest/app/commands.hpp"

#include "ingest/app/options.hpp"
#include "ingest/core/config.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/exec/executor.hpp"
#include "ingest/plan/organize_planner.hpp"
#include "ingest/report/report.hpp"
#include "ingest/scan/source_scanner.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace ingest::app {

int run_organize(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed = parse_organize_args(args);
    if (parsed.is_error()) {
        err << "Error: " << parsed.error() << "\n\n" << organize_usage();
        return kExitUsage;
    }
    const OrganizeOptions& options = parsed.value();
    if (options.help) {
        out << organize_usage();
        return kExitOk;
    }

    auto configured = resolve_config(options.config_path, options.log_level);
    if (configured.is_error()) {
        err << "Error: " << configured.error() << "\n";
        return kExitUsage;
    }
    const IngestConfig& config = configured.value();
    spdlog::debug("Mode: {}{}, duplicate policy: {}", options.move ? "move" : "copy",
                  options.approve ? "" : " (dry run)", to_string(config.duplicate_policy));

    for (const auto& check : {require_directory(options.source, "Source directory"),
                              require_directory(options.destination, "Destination directory")}) {
        if (check.is_error()) {
            err << "Error: " << check.error() << "\n";
            return kExitUsage;
        }
    }

    scan::SourceScanner scanner;
    auto scanned = scanner.scan(options.source);
    if (scanned.is_error()) {
        err << "Error: " << scanned.error() << "\n";
        return kExitUsage;
    }

    const auto mode = options.move ? plan::TransferMode::Move : plan::TransferMode::Copy;
    plan::OrganizePlanner planner(config, mode);
    auto archive = plan::FilesystemArchiveView::open(options.destination);
    if (archive.is_error()) {
        err << "Error: " << archive.error() << "\n";
        return kExitUsage;
    }
    const auto organize_plan = planner.build(scanned.value().files, archive.value());

    if (organize_plan.managed_files == 0) {
        out << "No " << config.family_name << " files found in source directory.\n";
        return kExitOk;
    }

    report::ReportOptions report_options;
    report_options.approved = options.approve;
    report_options.mode = mode;
    report_options.family_name = config.family_name;

    report::print_plan_header(out, organize_plan, report_options);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::RunTally tally(bus);
    report::ConsoleReport console(bus, out, report_options);

    const auto started = std::chrono::steady_clock::now();
    events::RunStartedEvent run_started;
    run_started.source_root = options.source.string();
    run_started.destination_root = options.destination.string();
    run_started.approved = options.approve;
    run_started.entry_count = organize_plan.entries.size();
    bus.emit(run_started);

    exec::Executor executor(bus, options.approve);
    executor.run(organize_plan.entries);

    events::RunFinishedEvent run_finished;
    run_finished.approved = options.approve;
    run_finished.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    bus.emit(run_finished);

    report::print_summary(out, organize_plan, tally.stats(), report_options);

    int exit_code = kExitOk;
    if (options.report_path) {
        auto written = report::write_json_report(*options.report_path, organize_plan, tally.stats(),
                                                 report_options);
        if (written.is_error()) {
            err << "Error: " << written.error() << "\n";
            exit_code = kExitRunErrors;
        }
    }

    if (organize_plan.has_errors() || tally.stats().errors() > 0) {
        exit_code = kExitRunErrors;
    }
    return exit_code;
}

} // namespace ingest::app
