/**
 * @file components.hpp
 * @brief Observers of run events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * RunTally tally(bus);
 * executor.run(plan.entries);
 * auto stats = tally.stats();
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>

namespace ingest::events {

/**
 * @brief Logs every run event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<RunStartedEvent>([this](const RunStartedEvent& e) { on_run_started(e); });
        bus_.subscribe<RunFinishedEvent>([this](const RunFinishedEvent& e) { on_run_finished(e); });
        bus_.subscribe<TransferPlannedEvent>([this](const TransferPlannedEvent& e) { on_planned(e); });
        bus_.subscribe<FileTransferredEvent>([this](const FileTransferredEvent& e) { on_transferred(e); });
        bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent& e) { on_skipped(e); });
        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) { on_failed(e); });
        bus_.subscribe<EntryRejectedEvent>([this](const EntryRejectedEvent& e) { on_rejected(e); });
    }

private:
    void on_run_started(const RunStartedEvent& e) {
        spdlog::info("Run started: {} -> {} ({} entries, {})", e.source_root, e.destination_root,
                     e.entry_count, e.approved ? "approved" : "dry run");
    }

    void on_run_finished(const RunFinishedEvent& e) {
        spdlog::info("Run finished in {}ms", e.duration.count());
    }

    void on_planned(const TransferPlannedEvent& e) {
        spdlog::debug("[Planned] {} {} -> {}", catalog::to_string(e.entry.action),
                      e.entry.file.source_path.string(), e.entry.destination_path.string());
    }

    void on_transferred(const FileTransferredEvent& e) {
        spdlog::info("[{}] {} -> {} bytes={} duration={}ms",
                     e.entry.action == catalog::PlanAction::Move ? "Moved" : "Copied",
                     e.entry.file.source_path.string(), e.entry.destination_path.string(),
                     e.bytes, e.duration.count());
    }

    void on_skipped(const FileSkippedEvent& e) {
        spdlog::debug("[Skipped] {} (same size at {})", e.entry.file.source_path.string(),
                      e.entry.destination_path.string());
    }

    void on_failed(const TransferFailedEvent& e) {
        spdlog::error("[Failed] {} -> {}: {}", e.entry.file.source_path.string(),
                      e.entry.destination_path.string(), e.error_message);
    }

    void on_rejected(const EntryRejectedEvent& e) {
        spdlog::warn("[Rejected] {}: {}", e.entry.file.source_path.string(), e.entry.detail);
    }

    EventBus& bus_;
};

/**
 * @brief Accumulates the numbers printed in the run summary
 *
 * In a preview run, "transferred" counts the transfers that would happen and
 * `bytes_transferred` the bytes that would be written.
 */
class RunTally {
public:
    struct Stats {
        std::uint64_t transferred = 0;
        std::uint64_t skipped = 0;
        std::uint64_t rejected = 0;
        std::uint64_t failed = 0;
        std::uint64_t bytes_transferred = 0;

        std::uint64_t errors() const noexcept { return rejected + failed; }
    };

    explicit RunTally(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferPlannedEvent>([this](const TransferPlannedEvent& e) {
            stats_.transferred++;
            stats_.bytes_transferred += e.entry.file.size_bytes;
        });

        bus_.subscribe<FileTransferredEvent>([this](const FileTransferredEvent& e) {
            stats_.transferred++;
            stats_.bytes_transferred += e.bytes;
        });

        bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent&) {
            stats_.skipped++;
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.failed++;
        });

        bus_.subscribe<EntryRejectedEvent>([this](const EntryRejectedEvent&) {
            stats_.rejected++;
        });
    }

    const Stats& stats() const { return stats_; }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace ingest::events
