#pragma once

#include "ingest/catalog/types.hpp"
#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/plan/archive_view.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ingest::plan {

/**
 * @brief More than one top-level folder claims the same date
 */
struct AmbiguousDateFolder {
    catalog::CalendarDate date;
    std::vector<std::string> candidates;  ///< Sorted folder names

    std::string describe() const;
};

using FolderResolution = Result<catalog::ArchiveDateFolder, AmbiguousDateFolder>;

/**
 * @brief Maps a date to the archive folder that owns it
 *
 * - exactly one existing folder whose name starts with the date: reuse it
 *   verbatim, keeping any suffix a human added ("2024-10-11 Paris Trip")
 * - none: propose a new bare `YYYY-MM-DD` folder
 * - several: AmbiguousDateFolder, never a guess
 */
class DestinationResolver {
public:
    explicit DestinationResolver(const IngestConfig& config);

    FolderResolution resolve(const catalog::CalendarDate& date, const ArchiveView& archive) const;

    /// Pure form over an explicit listing of the root's folder names
    FolderResolution resolve(const catalog::CalendarDate& date,
                             const std::filesystem::path& root,
                             const std::vector<std::string>& folder_names) const;

    /// `{folder}/{managed_subfolder}/{filename}`
    std::filesystem::path managed_path(const catalog::ArchiveDateFolder& folder,
                                       const std::string& filename) const;

private:
    std::string managed_subfolder_;
};

} // namespace ingest::plan
