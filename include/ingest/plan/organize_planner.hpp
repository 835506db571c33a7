#pragma once

#include "ingest/catalog/types.hpp"
#include "ingest/core/config.hpp"
#include "ingest/plan/action_planner.hpp"
#include "ingest/plan/archive_view.hpp"
#include "ingest/plan/date_resolver.hpp"
#include "ingest/plan/destination_resolver.hpp"
#include "ingest/plan/duplicate_guard.hpp"
#include "ingest/plan/file_classifier.hpp"

#include <vector>

namespace ingest::plan {

/**
 * @brief Complete placement decision for one source/destination pair
 */
struct OrganizePlan {
    std::vector<catalog::PlanEntry> entries;            ///< Enumeration order
    std::vector<DuplicateNameError> duplicates;
    std::vector<AmbiguousDateFolder> ambiguities;       ///< One per date
    std::vector<catalog::ManagedFile> not_processed;    ///< Held back by DuplicatePolicy::Abort
    std::size_t managed_files = 0;
    std::size_t ignored_files = 0;
    bool aborted = false;

    bool has_errors() const noexcept;
};

/**
 * @brief Two-phase placement pipeline
 *
 * PHASE 1 (index): classify every source file, resolve its date and index
 * its name across the whole source set; DuplicateGuard runs on the complete
 * index.
 * PHASE 2 (act): plan each unaffected file in enumeration order.
 *
 * Nothing here writes to the filesystem; the archive is only queried
 * through ArchiveView.
 */
class OrganizePlanner {
public:
    OrganizePlanner(const IngestConfig& config, TransferMode mode);

    OrganizePlan build(const std::vector<catalog::SourceFile>& sources, const ArchiveView& archive) const;

private:
    static void reject_colliding_destinations(std::vector<catalog::PlanEntry>& entries);

    DuplicatePolicy duplicate_policy_;
    FileClassifier classifier_;
    DateResolver date_resolver_;
    DestinationResolver destination_resolver_;
    ActionPlanner action_planner_;
    DuplicateGuard duplicate_guard_;
};

} // namespace ingest::plan
