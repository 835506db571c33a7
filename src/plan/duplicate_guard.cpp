#include "ingest/plan/duplicate_guard.hpp"

#include <sstream>

namespace ingest::plan {
namespace fs = std::filesystem;

void SourceFileIndex::add(const std::string& filename, const std::string& subtree, const fs::path& path) {
    entries_[filename].by_subtree[subtree].push_back(path);
}

std::string DuplicateNameError::describe() const {
    std::ostringstream oss;
    oss << "'" << filename << "' appears in " << subtrees.size() << " source folders:";
    for (std::size_t i = 0; i < subtrees.size(); ++i) {
        oss << (i == 0 ? " " : ", ") << subtrees[i];
    }
    return oss.str();
}

std::vector<DuplicateNameError> DuplicateGuard::validate(const SourceFileIndex& index) const {
    std::vector<DuplicateNameError> errors;

    for (const auto& [filename, occurrences] : index.entries_) {
        if (occurrences.by_subtree.size() < 2) {
            continue;
        }

        DuplicateNameError error;
        error.filename = filename;
        for (const auto& [subtree, paths] : occurrences.by_subtree) {
            error.subtrees.push_back(subtree);
            error.paths.insert(error.paths.end(), paths.begin(), paths.end());
        }
        errors.push_back(std::move(error));
    }

    return errors;
}

} // namespace ingest::plan
