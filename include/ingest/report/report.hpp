#pragma once

#include "ingest/core/result.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/plan/action_planner.hpp"
#include "ingest/plan/organize_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

namespace ingest::report {

/// 1024-based, one decimal: 500 -> "500.0 B", 1536 -> "1.5 KB"
std::string format_size(std::uint64_t size_bytes);

struct ReportOptions {
    bool approved = false;
    plan::TransferMode mode = plan::TransferMode::Copy;
    std::string family_name = "Insta360";
};

/**
 * @brief Writes the plan header: totals, duplicate names, ambiguous dates
 */
void print_plan_header(std::ostream& out, const plan::OrganizePlan& plan, const ReportOptions& options);

/**
 * @brief Writes the closing summary from the run tally
 */
void print_summary(std::ostream& out, const plan::OrganizePlan& plan,
                   const events::RunTally::Stats& stats, const ReportOptions& options);

/**
 * @brief One line per plan entry, written as the executor emits events
 */
class ConsoleReport {
public:
    ConsoleReport(events::EventBus& bus, std::ostream& out, ReportOptions options);

private:
    std::string describe_overwrite(const catalog::PlanEntry& entry) const;

    events::EventBus& bus_;
    std::ostream& out_;
    ReportOptions options_;
};

/// Machine-readable copy of the plan and summary
Result<void> write_json_report(const std::filesystem::path& path,
                               const plan::OrganizePlan& plan,
                               const events::RunTally::Stats& stats,
                               const ReportOptions& options);

} // namespace ingest::report
