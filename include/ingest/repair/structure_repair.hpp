#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/plan/file_classifier.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ingest::repair {

struct TopLevelEntry {
    std::string name;
    bool is_directory = false;
};

struct RepairMove {
    std::filesystem::path source;
    std::filesystem::path target_dir;
    std::filesystem::path target;
};

/**
 * @brief Corrective script for an archive that predates the managed subfolder
 *
 * `lines` is empty when nothing needs to move. Warnings are meant for
 * stderr; the script itself is inert text and is never executed here.
 */
struct RepairScript {
    std::vector<std::string> lines;
    std::vector<RepairMove> moves;
    std::vector<std::string> non_compliant_folders;
    std::vector<std::string> warnings;
    std::size_t managed_files = 0;
    std::size_t compliant_files = 0;
};

/**
 * @brief Finds managed files that sit outside `{date folder}/{managed_subfolder}/`
 *
 * For every top-level date folder (same name pattern the organizer uses),
 * each managed file below it that is not already under the managed subfolder
 * gets an idempotent `mkdir -p` for the subfolder followed by an `mv`.
 * Top-level folders that are not date folders are reported, not touched.
 */
class StructureRepairPlanner {
public:
    explicit StructureRepairPlanner(const IngestConfig& config);

    /// Lists `archive_root` and builds the script; fails if any part is unreadable
    Result<RepairScript> scan(const std::filesystem::path& archive_root) const;

    /**
     * @brief Decision step without any I/O
     *
     * `files` are every regular file below the root, relative and
     * '/'-separated; they are also used to detect targets that already exist.
     */
    RepairScript build(const std::filesystem::path& archive_root,
                       const std::vector<TopLevelEntry>& top_level,
                       const std::vector<std::string>& files) const;

    /// Single-quote `text` for POSIX shells
    static std::string shell_quote(const std::string& text);

private:
    std::vector<std::string> render(const std::vector<RepairMove>& moves) const;

    plan::FileClassifier classifier_;
    std::string managed_subfolder_;
};

} // namespace ingest::repair
