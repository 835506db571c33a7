#include "ingest/plan/file_classifier.hpp"

#include "ingest/core/strings.hpp"

#include <filesystem>

namespace ingest::plan {
namespace fs = std::filesystem;

FileClassifier::FileClassifier(const IngestConfig& config)
    : excluded_folders_(config.excluded_folders.begin(), config.excluded_folders.end()) {
    for (const auto& ext : config.managed_extensions) {
        extensions_.insert(to_lower_ascii(ext));
    }
    for (const auto& name : config.managed_names) {
        names_.insert(to_lower_ascii(name));
    }
}

FileClass FileClassifier::classify(const std::string& relative_path) const {
    const fs::path path(relative_path);
    if (!is_managed_name(path.filename().string())) {
        return FileClass::Ignored;
    }
    if (in_excluded_folder(relative_path)) {
        return FileClass::Ignored;
    }
    return FileClass::Managed;
}

bool FileClassifier::is_managed_name(const std::string& filename) const {
    const std::string lower = to_lower_ascii(filename);
    if (names_.count(lower) > 0) {
        return true;
    }
    const std::string ext = fs::path(lower).extension().string();
    return !ext.empty() && extensions_.count(ext) > 0;
}

bool FileClassifier::in_excluded_folder(const std::string& relative_path) const {
    const fs::path parent = fs::path(relative_path).parent_path();
    for (const auto& component : parent) {
        if (excluded_folders_.count(component.string()) > 0) {
            return true;
        }
    }
    return false;
}

} // namespace ingest::plan
