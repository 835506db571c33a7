#include "ingest/report/report.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace ingest::report {
using catalog::PlanAction;
using catalog::PlanEntry;
using json = nlohmann::json;

namespace {

const char* rejection_kind(PlanAction action) {
    switch (action) {
        case PlanAction::ErrorDuplicateName: return "duplicate name";
        case PlanAction::ErrorAmbiguousDateFolder: return "ambiguous date folder";
        case PlanAction::ErrorDestinationUnreadable: return "unreadable destination";
        default: return "rejected";
    }
}

const char* verb(const ReportOptions& options) {
    return options.mode == plan::TransferMode::Move ? "move" : "copy";
}

const char* past_tense(const ReportOptions& options) {
    return options.mode == plan::TransferMode::Move ? "moved" : "copied";
}

const char* progressive(const ReportOptions& options) {
    return options.mode == plan::TransferMode::Move ? "Moving" : "Copying";
}

json entry_to_json(const PlanEntry& entry) {
    json j;
    j["source"] = entry.file.source_path.string();
    j["filename"] = entry.file.filename;
    j["subtree"] = entry.file.subtree;
    j["size"] = entry.file.size_bytes;
    j["date"] = entry.file.resolved_date.to_string();
    j["action"] = catalog::to_string(entry.action);
    j["destination"] = entry.destination_path.string();
    if (entry.existing_size) {
        j["existing_size"] = *entry.existing_size;
    }
    if (!entry.detail.empty()) {
        j["detail"] = entry.detail;
    }
    return j;
}

} // namespace

std::string format_size(std::uint64_t size_bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(size_bytes);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    for (const char* unit : kUnits) {
        if (size < 1024.0) {
            oss << size << " " << unit;
            return oss.str();
        }
        size /= 1024.0;
    }
    oss << size << " PB";
    return oss.str();
}

void print_plan_header(std::ostream& out, const plan::OrganizePlan& plan, const ReportOptions& options) {
    std::size_t transfers = 0;
    std::size_t skips = 0;
    std::uint64_t bytes = 0;
    for (const auto& entry : plan.entries) {
        if (catalog::is_transfer(entry.action)) {
            ++transfers;
            bytes += entry.file.size_bytes;
        } else if (entry.action == PlanAction::SkipIdenticalSize) {
            ++skips;
        }
    }

    if (options.approved) {
        out << progressive(options) << " " << transfers << " files (" << format_size(bytes) << ")\n";
    } else {
        out << "[DRY RUN] Would " << verb(options) << " " << transfers << " files ("
            << format_size(bytes) << ")\n";
    }

    if (skips > 0) {
        out << "Skipping " << skips << " files (already exist with same size)\n";
    }

    for (const auto& duplicate : plan.duplicates) {
        out << "ERROR duplicate name " << duplicate.describe() << "\n";
        for (const auto& path : duplicate.paths) {
            out << "  " << path.string() << "\n";
        }
    }

    for (const auto& ambiguity : plan.ambiguities) {
        out << "ERROR ambiguous date folder: " << ambiguity.describe() << "\n";
    }

    if (plan.aborted) {
        out << "Aborting: duplicate names found and duplicate_policy is 'abort'; "
            << plan.not_processed.size() << " other files were not processed\n";
    }

    out << "\n";
}

void print_summary(std::ostream& out, const plan::OrganizePlan& plan,
                   const events::RunTally::Stats& stats, const ReportOptions& options) {
    out << "\n";
    if (options.approved) {
        out << "Summary: " << stats.transferred << " " << past_tense(options) << ", "
            << stats.skipped << " skipped (same size), "
            << stats.errors() << " errors, "
            << format_size(stats.bytes_transferred) << " transferred\n";
    } else {
        out << "Summary: " << stats.transferred << " to " << verb(options) << ", "
            << stats.skipped << " skipped (same size), "
            << stats.errors() << " errors, "
            << format_size(stats.bytes_transferred) << " to transfer\n";
    }

    if (!plan.not_processed.empty()) {
        out << plan.not_processed.size() << " files not processed\n";
    }

    if (!options.approved && stats.transferred > 0) {
        out << "\nRun with --approve to " << verb(options) << " files.\n";
    }
}

ConsoleReport::ConsoleReport(events::EventBus& bus, std::ostream& out, ReportOptions options)
    : bus_(bus), out_(out), options_(std::move(options)) {
    bus_.subscribe<events::TransferPlannedEvent>([this](const events::TransferPlannedEvent& e) {
        out_ << "Would " << verb(options_) << ": " << e.entry.file.source_path.string() << " -> "
             << e.entry.destination_path.string() << describe_overwrite(e.entry) << "\n";
    });

    bus_.subscribe<events::FileTransferredEvent>([this](const events::FileTransferredEvent& e) {
        out_ << (e.entry.action == PlanAction::Move ? "Moved: " : "Copied: ")
             << e.entry.file.source_path.string() << " -> " << e.entry.destination_path.string()
             << describe_overwrite(e.entry) << "\n";
    });

    bus_.subscribe<events::FileSkippedEvent>([this](const events::FileSkippedEvent& e) {
        out_ << "Skipped (same size): " << e.entry.file.source_path.string() << " -> "
             << e.entry.destination_path.string() << "\n";
    });

    bus_.subscribe<events::TransferFailedEvent>([this](const events::TransferFailedEvent& e) {
        out_ << "ERROR failed to " << verb(options_) << " " << e.entry.file.source_path.string()
             << ": " << e.error_message << "\n";
    });

    bus_.subscribe<events::EntryRejectedEvent>([this](const events::EntryRejectedEvent& e) {
        out_ << "ERROR " << rejection_kind(e.entry.action) << ": " << e.entry.file.source_path.string()
             << " (" << e.entry.detail << ")\n";
    });
}

std::string ConsoleReport::describe_overwrite(const PlanEntry& entry) const {
    if (!entry.overwrites_existing()) {
        return {};
    }
    return " (overwrites existing, " + format_size(*entry.existing_size) + " -> " +
           format_size(entry.file.size_bytes) + ")";
}

Result<void> write_json_report(const std::filesystem::path& path,
                               const plan::OrganizePlan& plan,
                               const events::RunTally::Stats& stats,
                               const ReportOptions& options) {
    json doc;
    doc["approved"] = options.approved;
    doc["mode"] = verb(options);
    doc["aborted"] = plan.aborted;
    doc["managed_files"] = plan.managed_files;
    doc["ignored_files"] = plan.ignored_files;

    doc["entries"] = json::array();
    for (const auto& entry : plan.entries) {
        doc["entries"].push_back(entry_to_json(entry));
    }

    doc["duplicates"] = json::array();
    for (const auto& duplicate : plan.duplicates) {
        json paths = json::array();
        for (const auto& p : duplicate.paths) {
            paths.push_back(p.string());
        }
        doc["duplicates"].push_back({{"filename", duplicate.filename},
                                     {"subtrees", duplicate.subtrees},
                                     {"paths", paths}});
    }

    doc["ambiguous_dates"] = json::array();
    for (const auto& ambiguity : plan.ambiguities) {
        doc["ambiguous_dates"].push_back({{"date", ambiguity.date.to_string()},
                                          {"folders", ambiguity.candidates}});
    }

    doc["summary"] = {{"transferred", stats.transferred},
                      {"skipped", stats.skipped},
                      {"rejected", stats.rejected},
                      {"failed", stats.failed},
                      {"bytes_transferred", stats.bytes_transferred}};

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Err<void>(std::string("Failed to open report file: ") + path.string());
    }
    output << doc.dump(2) << "\n";
    if (!output) {
        return Err<void>(std::string("Failed to write report file: ") + path.string());
    }
    return Ok();
}

} // namespace ingest::report
