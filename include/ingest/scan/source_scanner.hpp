#pragma once

#include "ingest/catalog/types.hpp"
#include "ingest/core/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ingest::scan {

struct ScanResult {
    std::vector<catalog::SourceFile> files;  ///< Sorted by relative path
};

/**
 * @brief Recursively lists the regular files under a source root
 *
 * The listing is all or nothing: an unreadable directory, or a file whose
 * type, size or timestamps cannot be read, fails the whole scan. Duplicate
 * detection and placement depend on seeing every file.
 */
class SourceScanner {
public:
    Result<ScanResult> scan(const std::filesystem::path& root) const;

private:
    static std::string top_level_subtree(const std::filesystem::path& relative);
};

} // namespace ingest::scan
