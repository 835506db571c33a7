#pragma once

#include "ingest/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest {

enum class DuplicatePolicy {
    SkipAffected,  ///< Exclude only the conflicting filenames, plan the rest
    Abort          ///< Any conflict suppresses the whole plan
};

const char* to_string(DuplicatePolicy policy) noexcept;
std::optional<DuplicatePolicy> duplicate_policy_from_string(const std::string& text);

/**
 * @brief Settings shared by the organize and repair tools
 *
 * Defaults describe the Insta360 card layout. A JSON file can override any
 * subset of the keys; see load_config().
 */
struct IngestConfig {
    std::vector<std::string> managed_extensions{".insv", ".insp", ".lrv"};
    std::vector<std::string> managed_names{"fileinfo_list.list"};
    std::vector<std::string> excluded_folders{"MISC", ".Trashes", ".Spotlight-V100", ".fseventsd"};
    std::vector<std::string> date_prefixes{"VID", "LRV", "IMG", "PRO_VID", "PRO_LRV"};
    std::string managed_subfolder = "insta360";
    DuplicatePolicy duplicate_policy = DuplicatePolicy::SkipAffected;
    std::string log_level = "warn";

    /// Name of the format family, used in user-facing messages
    std::string family_name = "Insta360";
};

/**
 * @brief Read a JSON config file on top of the defaults
 *
 * EXAMPLE:
 * {
 *   "managed_extensions": [".insv", ".insp", ".lrv"],
 *   "excluded_folders": ["MISC"],
 *   "managed_subfolder": "insta360",
 *   "duplicate_policy": "abort",
 *   "log_level": "info"
 * }
 *
 * Unknown keys are ignored with a warning. Malformed JSON, a value of the
 * wrong type or an empty `managed_subfolder` are errors.
 */
Result<IngestConfig> load_config(const std::filesystem::path& config_path);

/// Same as load_config() but from an in-memory document
Result<IngestConfig> parse_config(const std::string& json_text);

} // namespace ingest
