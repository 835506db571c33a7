#pragma once

#include "ingest/catalog/types.hpp"
#include "ingest/plan/archive_view.hpp"
#include "ingest/plan/destination_resolver.hpp"

namespace ingest::plan {

enum class TransferMode {
    Copy,
    Move
};

/**
 * @brief Decides copy/move/skip for one managed file
 *
 * Same name and same size at the destination -> SkipIdenticalSize.
 * Same name, different size -> Copy/Move anyway, overwriting the archived
 * entry (PlanEntry::existing_size records the old size so the report can
 * flag it). Size equality is the only identity check; contents are never
 * compared.
 */
class ActionPlanner {
public:
    ActionPlanner(const DestinationResolver& resolver, TransferMode mode);

    catalog::PlanEntry plan(const catalog::ManagedFile& file, const ArchiveView& archive) const;

private:
    const DestinationResolver& resolver_;
    TransferMode mode_;
};

} // namespace ingest::plan
