/**
 * @file events.hpp
 * @brief Events emitted while a plan is reported or executed
 *
 * NAMING CONVENTION:
 * Events are past-tense facts about one plan entry or about the run.
 */

#pragma once

#include "ingest/catalog/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ingest::events {

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

struct RunStartedEvent {
    std::string source_root;
    std::string destination_root;
    bool approved = false;
    std::size_t entry_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RunFinishedEvent {
    bool approved = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Per-entry Events
// ════════════════════════════════════════════════════════

/**
 * @brief A Copy/Move that a preview run would perform
 *
 * WHO EMITS: Executor without approval
 * WHO SUBSCRIBES: LoggerComponent, RunTally, console report
 */
struct TransferPlannedEvent {
    catalog::PlanEntry entry;
};

/**
 * @brief A Copy/Move that completed
 */
struct FileTransferredEvent {
    catalog::PlanEntry entry;
    std::uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
};

struct FileSkippedEvent {
    catalog::PlanEntry entry;
};

/**
 * @brief A Copy/Move that failed on I/O; the run continues with the next entry
 */
struct TransferFailedEvent {
    catalog::PlanEntry entry;
    std::string error_message;
};

/**
 * @brief An entry the planner refused (duplicate name or ambiguous date folder)
 */
struct EntryRejectedEvent {
    catalog::PlanEntry entry;
};

} // namespace ingest::events
