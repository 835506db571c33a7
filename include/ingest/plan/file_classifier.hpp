#pragma once

#include "ingest/core/config.hpp"

#include <string>
#include <unordered_set>

namespace ingest::plan {

enum class FileClass {
    Managed,
    Ignored
};

/**
 * @brief Decides which files belong to the managed format family
 *
 * A file is Managed iff its name matches a managed extension or an exact
 * managed name (both case-insensitive) and none of its parent folders,
 * relative to the scanned root, is an excluded folder name (exact match).
 */
class FileClassifier {
public:
    explicit FileClassifier(const IngestConfig& config);

    /// `relative_path` is relative to the scanned root, '/'-separated
    FileClass classify(const std::string& relative_path) const;

    bool is_managed_name(const std::string& filename) const;
    bool in_excluded_folder(const std::string& relative_path) const;

private:
    std::unordered_set<std::string> extensions_;
    std::unordered_set<std::string> names_;
    std::unordered_set<std::string> excluded_folders_;
};

} // namespace ingest::plan
