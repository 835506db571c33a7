#pragma once

#include "ingest/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest::plan {

/**
 * @brief What already sits at a planned destination path
 */
struct DestinationEntry {
    std::uint64_t size_bytes = 0;
    bool is_regular_file = true;
    bool same_file_as_source = false;  ///< Same inode (same path, symlink or hard link)
};

/**
 * @brief Read-only view of the destination archive
 *
 * The planners only ever query the archive through this interface, so the
 * decision logic runs unchanged against the real filesystem or an in-memory
 * fake.
 */
class ArchiveView {
public:
    virtual ~ArchiveView() = default;

    virtual const std::filesystem::path& root() const = 0;

    /// Names of the directories directly under root()
    virtual std::vector<std::string> top_level_folders() const = 0;

    /// Entry at `destination`, nullopt when nothing is there, or an error
    /// when the path exists but cannot be examined
    virtual Result<std::optional<DestinationEntry>> inspect(const std::filesystem::path& destination,
                                                            const std::filesystem::path& source) const = 0;
};

/**
 * @brief ArchiveView backed by std::filesystem
 *
 * The top-level listing is read once by open(); a run plans everything
 * before it executes anything, so the listing cannot go stale mid-plan.
 */
class FilesystemArchiveView : public ArchiveView {
public:
    /// Lists `root`; fails when the listing cannot be read completely
    static Result<FilesystemArchiveView> open(std::filesystem::path root);

    const std::filesystem::path& root() const override { return root_; }

    std::vector<std::string> top_level_folders() const override { return folders_; }

    Result<std::optional<DestinationEntry>> inspect(const std::filesystem::path& destination,
                                                    const std::filesystem::path& source) const override;

private:
    FilesystemArchiveView(std::filesystem::path root, std::vector<std::string> folders);

    std::filesystem::path root_;
    std::vector<std::string> folders_;
};

} // namespace ingest::plan
