#include "ingest/plan/organize_planner.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <set>
#include <unordered_map>

namespace ingest::plan {
using catalog::ManagedFile;
using catalog::PlanAction;
using catalog::PlanEntry;
using catalog::SourceFile;

bool OrganizePlan::has_errors() const noexcept {
    if (aborted || !duplicates.empty()) {
        return true;
    }
    for (const auto& entry : entries) {
        if (catalog::is_error(entry.action)) {
            return true;
        }
    }
    return false;
}

OrganizePlanner::OrganizePlanner(const IngestConfig& config, TransferMode mode)
    : duplicate_policy_(config.duplicate_policy),
      classifier_(config),
      date_resolver_(config),
      destination_resolver_(config),
      action_planner_(destination_resolver_, mode) {}

OrganizePlan OrganizePlanner::build(const std::vector<SourceFile>& sources, const ArchiveView& archive) const {
    OrganizePlan plan;

    // Phase 1: classify and index the complete source set
    std::vector<ManagedFile> managed;
    SourceFileIndex index;
    for (const auto& source : sources) {
        if (classifier_.classify(source.relative_path) != FileClass::Managed) {
            ++plan.ignored_files;
            continue;
        }

        ManagedFile file;
        file.source_path = source.absolute_path;
        file.filename = source.absolute_path.filename().string();
        file.subtree = source.subtree;
        file.size_bytes = source.size_bytes;

        const auto resolved = date_resolver_.resolve(file.filename, source.timestamps);
        file.resolved_date = resolved.date;
        spdlog::debug("{} -> {} (from {})", source.relative_path, resolved.date.to_string(),
                      to_string(resolved.source));

        index.add(file.filename, file.subtree, file.source_path);
        managed.push_back(std::move(file));
    }
    plan.managed_files = managed.size();

    plan.duplicates = duplicate_guard_.validate(index);
    std::unordered_map<std::string, const DuplicateNameError*> duplicate_by_name;
    for (const auto& duplicate : plan.duplicates) {
        spdlog::warn("Duplicate name: {}", duplicate.describe());
        duplicate_by_name.emplace(duplicate.filename, &duplicate);
    }

    if (!plan.duplicates.empty() && duplicate_policy_ == DuplicatePolicy::Abort) {
        plan.aborted = true;
    }

    // Phase 2: plan each file against the archive
    std::set<std::string> reported_dates;
    for (const auto& file : managed) {
        auto dup = duplicate_by_name.find(file.filename);
        if (dup != duplicate_by_name.end()) {
            PlanEntry entry;
            entry.file = file;
            entry.action = PlanAction::ErrorDuplicateName;
            entry.detail = dup->second->describe();
            plan.entries.push_back(std::move(entry));
            continue;
        }

        if (plan.aborted) {
            plan.not_processed.push_back(file);
            continue;
        }

        PlanEntry entry = action_planner_.plan(file, archive);
        if (entry.action == PlanAction::ErrorAmbiguousDateFolder &&
            reported_dates.insert(file.resolved_date.to_string()).second) {
            auto folder = destination_resolver_.resolve(file.resolved_date, archive);
            if (folder.is_error()) {
                spdlog::warn("Ambiguous destination: {}", folder.error().describe());
                plan.ambiguities.push_back(folder.error());
            }
        }
        plan.entries.push_back(std::move(entry));
    }

    reject_colliding_destinations(plan.entries);

    spdlog::info("Planned {} managed files ({} ignored, {} duplicate names, {} ambiguous dates)",
                 plan.managed_files, plan.ignored_files, plan.duplicates.size(), plan.ambiguities.size());
    return plan;
}

void OrganizePlanner::reject_colliding_destinations(std::vector<PlanEntry>& entries) {
    std::map<std::string, std::vector<std::size_t>> by_destination;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (!catalog::is_error(entries[i].action)) {
            by_destination[entries[i].destination_path.string()].push_back(i);
        }
    }

    for (const auto& [destination, indices] : by_destination) {
        if (indices.size() < 2) {
            continue;
        }
        spdlog::warn("{} source files would land on {}", indices.size(), destination);
        for (auto i : indices) {
            entries[i].action = PlanAction::ErrorDuplicateName;
            entries[i].detail = std::to_string(indices.size()) + " source files share the destination " + destination;
        }
    }
}

} // namespace ingest::plan
