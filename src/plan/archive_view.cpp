#include "ingest/plan/archive_view.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace ingest::plan {
namespace fs = std::filesystem;

using EntryResult = Result<std::optional<DestinationEntry>>;

FilesystemArchiveView::FilesystemArchiveView(fs::path root, std::vector<std::string> folders)
    : root_(std::move(root)), folders_(std::move(folders)) {}

Result<FilesystemArchiveView> FilesystemArchiveView::open(fs::path root) {
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return Err<FilesystemArchiveView>("Cannot list destination " + root.string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        const bool is_dir = it->is_directory(type_ec);
        if (type_ec) {
            return Err<FilesystemArchiveView>("Cannot inspect " + it->path().string() + ": " + type_ec.message());
        }
        if (is_dir) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return Err<FilesystemArchiveView>("Listing of " + root.string() + " stopped early: " + ec.message());
    }

    std::sort(names.begin(), names.end());
    spdlog::debug("Destination has {} top-level folders", names.size());
    return Ok(FilesystemArchiveView(std::move(root), std::move(names)));
}

EntryResult FilesystemArchiveView::inspect(const fs::path& destination, const fs::path& source) const {
    std::error_code ec;
    const auto status = fs::status(destination, ec);
    if (status.type() == fs::file_type::not_found) {
        return Ok<std::optional<DestinationEntry>>(std::nullopt);
    }
    if (ec) {
        return Err<std::optional<DestinationEntry>>("Cannot inspect " + destination.string() + ": " + ec.message());
    }

    DestinationEntry entry;
    entry.is_regular_file = fs::is_regular_file(status);
    if (entry.is_regular_file) {
        entry.size_bytes = fs::file_size(destination, ec);
        if (ec) {
            return Err<std::optional<DestinationEntry>>("Cannot read size of " + destination.string() + ": " +
                                                        ec.message());
        }
    }

    entry.same_file_as_source = fs::equivalent(source, destination, ec);
    if (ec) {
        return Err<std::optional<DestinationEntry>>("Cannot compare " + destination.string() + " with " +
                                                    source.string() + ": " + ec.message());
    }
    return Ok<std::optional<DestinationEntry>>(entry);
}

} // namespace ingest::plan
