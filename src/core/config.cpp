#include "ingest/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <unordered_set>

namespace ingest {
using json = nlohmann::json;

namespace {

const std::unordered_set<std::string>& known_keys() {
    static const std::unordered_set<std::string> keys{
        "managed_extensions", "managed_names", "excluded_folders", "date_prefixes",
        "managed_subfolder", "duplicate_policy", "log_level", "family_name"};
    return keys;
}

Result<void> read_string_list(const json& doc, const char* key, std::vector<std::string>& out) {
    if (!doc.contains(key)) {
        return Ok();
    }
    const auto& value = doc.at(key);
    if (!value.is_array()) {
        return Err<void>(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return Err<void>(std::string("'") + key + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
    return Ok();
}

Result<void> read_string(const json& doc, const char* key, std::string& out) {
    if (!doc.contains(key)) {
        return Ok();
    }
    if (!doc.at(key).is_string()) {
        return Err<void>(std::string("'") + key + "' must be a string");
    }
    out = doc.at(key).get<std::string>();
    return Ok();
}

} // namespace

const char* to_string(DuplicatePolicy policy) noexcept {
    switch (policy) {
        case DuplicatePolicy::SkipAffected: return "skip-affected";
        case DuplicatePolicy::Abort: return "abort";
    }
    return "unknown";
}

std::optional<DuplicatePolicy> duplicate_policy_from_string(const std::string& text) {
    if (text == "skip-affected") {
        return DuplicatePolicy::SkipAffected;
    }
    if (text == "abort") {
        return DuplicatePolicy::Abort;
    }
    return std::nullopt;
}

Result<IngestConfig> parse_config(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<IngestConfig>(std::string("Invalid JSON in config"));
    }
    if (!doc.is_object()) {
        return Err<IngestConfig>(std::string("Config must be a JSON object"));
    }

    for (const auto& item : doc.items()) {
        if (known_keys().count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown config key '{}'", item.key());
        }
    }

    IngestConfig config;
    for (auto res : {read_string_list(doc, "managed_extensions", config.managed_extensions),
                     read_string_list(doc, "managed_names", config.managed_names),
                     read_string_list(doc, "excluded_folders", config.excluded_folders),
                     read_string_list(doc, "date_prefixes", config.date_prefixes),
                     read_string(doc, "managed_subfolder", config.managed_subfolder),
                     read_string(doc, "log_level", config.log_level),
                     read_string(doc, "family_name", config.family_name)}) {
        if (res.is_error()) {
            return Err<IngestConfig>(res.error());
        }
    }

    if (config.managed_subfolder.empty()) {
        return Err<IngestConfig>(std::string("'managed_subfolder' must not be empty"));
    }

    std::string policy_text;
    if (auto res = read_string(doc, "duplicate_policy", policy_text); res.is_error()) {
        return Err<IngestConfig>(res.error());
    }
    if (!policy_text.empty()) {
        auto policy = duplicate_policy_from_string(policy_text);
        if (!policy) {
            return Err<IngestConfig>("Unknown duplicate_policy '" + policy_text +
                                     "' (expected 'skip-affected' or 'abort')");
        }
        config.duplicate_policy = *policy;
    }

    return Ok(config);
}

Result<IngestConfig> load_config(const std::filesystem::path& config_path) {
    std::ifstream input(config_path);
    if (!input) {
        return Err<IngestConfig>(std::string("Failed to open config file: ") + config_path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto result = parse_config(buffer.str());
    if (result.is_error()) {
        return Err<IngestConfig>(config_path.string() + ": " + result.error());
    }
    spdlog::info("Loaded config from {}", config_path.string());
    return result;
}

} // namespace ingest
