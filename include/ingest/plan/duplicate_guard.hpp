#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace ingest::plan {

/**
 * @brief filename -> top-level source subtrees that contain it
 *
 * Built once over the complete source listing before any plan entry is
 * produced. Ordered containers keep error reports deterministic.
 */
class SourceFileIndex {
public:
    void add(const std::string& filename, const std::string& subtree, const std::filesystem::path& path);

private:
    friend class DuplicateGuard;

    struct Occurrences {
        std::map<std::string, std::vector<std::filesystem::path>> by_subtree;
    };

    std::map<std::string, Occurrences> entries_;
};

/**
 * @brief One filename found under more than one top-level source subtree
 */
struct DuplicateNameError {
    std::string filename;
    std::vector<std::string> subtrees;            ///< Sorted, at least two
    std::vector<std::filesystem::path> paths;     ///< Every source path with this name

    std::string describe() const;
};

/**
 * @brief Enforces that a filename never spans two source subtrees
 *
 * Two cards reusing the same camera-assigned name would otherwise land on the
 * same archive path and overwrite each other.
 */
class DuplicateGuard {
public:
    std::vector<DuplicateNameError> validate(const SourceFileIndex& index) const;
};

} // namespace ingest::plan
