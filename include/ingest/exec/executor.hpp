#pragma once

#include "ingest/catalog/types.hpp"
#include "ingest/core/result.hpp"
#include "ingest/events/event_bus.hpp"

#include <filesystem>
#include <vector>

namespace ingest::exec {

/**
 * @brief Applies plan entries to the filesystem
 *
 * Without approval the executor only announces what it would do
 * (TransferPlannedEvent); it never touches the destination. With approval,
 * Copy/Move entries are performed one at a time in plan order. A failing
 * entry is reported and the run moves on to the next one.
 */
class Executor {
public:
    static constexpr const char* kPartialSuffix = ".ingest-partial";

    Executor(events::EventBus& bus, bool approved);

    /// Emits exactly one per-entry event for every entry
    void run(const std::vector<catalog::PlanEntry>& entries);

    /// Perform a single Copy/Move entry
    Result<void> apply(const catalog::PlanEntry& entry) const;

    /// Move fallback when rename() crosses filesystems: staged copy, then
    /// unlink the source. The source stays in place if the copy fails.
    static Result<void> copy_then_remove(const std::filesystem::path& source,
                                         const std::filesystem::path& destination);

private:
    static Result<void> copy_file(const std::filesystem::path& source,
                                  const std::filesystem::path& destination);

    static Result<void> move_file(const std::filesystem::path& source,
                                  const std::filesystem::path& destination);

    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    events::EventBus& bus_;
    bool approved_;
};

} // namespace ingest::exec
