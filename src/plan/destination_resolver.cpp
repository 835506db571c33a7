#include "ingest/plan/destination_resolver.hpp"

#include "ingest/catalog/date_folder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace ingest::plan {
namespace fs = std::filesystem;
using catalog::ArchiveDateFolder;
using catalog::CalendarDate;

std::string AmbiguousDateFolder::describe() const {
    std::ostringstream oss;
    oss << "date " << date.to_string() << " is claimed by " << candidates.size() << " folders:";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        oss << (i == 0 ? " '" : ", '") << candidates[i] << "'";
    }
    return oss.str();
}

DestinationResolver::DestinationResolver(const IngestConfig& config)
    : managed_subfolder_(config.managed_subfolder) {}

FolderResolution DestinationResolver::resolve(const CalendarDate& date, const ArchiveView& archive) const {
    return resolve(date, archive.root(), archive.top_level_folders());
}

FolderResolution DestinationResolver::resolve(const CalendarDate& date,
                                              const fs::path& root,
                                              const std::vector<std::string>& folder_names) const {
    std::vector<std::string> matches;
    for (const auto& name : folder_names) {
        if (catalog::folder_owns_date(name, date)) {
            matches.push_back(name);
        }
    }

    if (matches.size() > 1) {
        std::sort(matches.begin(), matches.end());
        spdlog::debug("Date {} is ambiguous ({} folders)", date.to_string(), matches.size());
        return Failure(AmbiguousDateFolder{date, std::move(matches)});
    }

    ArchiveDateFolder folder;
    folder.date = date;
    folder.name = matches.empty() ? date.to_string() : matches.front();
    folder.path = root / folder.name;
    return Success(std::move(folder));
}

fs::path DestinationResolver::managed_path(const ArchiveDateFolder& folder, const std::string& filename) const {
    return folder.path / managed_subfolder_ / filename;
}

} // namespace ingest::plan
