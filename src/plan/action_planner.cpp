#include "ingest/plan/action_planner.hpp"

#include <spdlog/spdlog.h>

namespace ingest::plan {
using catalog::PlanAction;
using catalog::PlanEntry;

ActionPlanner::ActionPlanner(const DestinationResolver& resolver, TransferMode mode)
    : resolver_(resolver), mode_(mode) {}

PlanEntry ActionPlanner::plan(const catalog::ManagedFile& file, const ArchiveView& archive) const {
    PlanEntry entry;
    entry.file = file;

    auto folder = resolver_.resolve(file.resolved_date, archive);
    if (folder.is_error()) {
        entry.action = PlanAction::ErrorAmbiguousDateFolder;
        entry.detail = folder.error().describe();
        return entry;
    }

    entry.destination_path = resolver_.managed_path(folder.value(), file.filename);
    const PlanAction transfer = (mode_ == TransferMode::Move) ? PlanAction::Move : PlanAction::Copy;

    auto inspected = archive.inspect(entry.destination_path, file.source_path);
    if (inspected.is_error()) {
        entry.action = PlanAction::ErrorDestinationUnreadable;
        entry.detail = inspected.error();
        return entry;
    }

    const auto& existing = inspected.value();
    if (!existing) {
        entry.action = transfer;
        return entry;
    }

    if (existing->same_file_as_source) {
        entry.action = PlanAction::SkipIdenticalSize;
        entry.existing_size = existing->size_bytes;
        entry.detail = "source and destination are the same file";
        return entry;
    }

    if (!existing->is_regular_file) {
        entry.action = transfer;
        entry.detail = "destination exists and is not a regular file";
        return entry;
    }

    entry.existing_size = existing->size_bytes;
    if (existing->size_bytes == file.size_bytes) {
        entry.action = PlanAction::SkipIdenticalSize;
        return entry;
    }

    spdlog::debug("{}: archived copy is {} bytes, source is {} bytes; will overwrite",
                  file.filename, existing->size_bytes, file.size_bytes);
    entry.action = transfer;
    return entry;
}

} // namespace ingest::plan
