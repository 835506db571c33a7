#include "ingest/repair/structure_repair.hpp"

#include "ingest/catalog/date_folder.hpp"
#include "ingest/scan/source_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <system_error>

namespace ingest::repair {
namespace fs = std::filesystem;

StructureRepairPlanner::StructureRepairPlanner(const IngestConfig& config)
    : classifier_(config), managed_subfolder_(config.managed_subfolder) {}

Result<RepairScript> StructureRepairPlanner::scan(const fs::path& archive_root) const {
    std::vector<TopLevelEntry> top_level;
    std::error_code ec;
    fs::directory_iterator it(archive_root, ec);
    if (ec) {
        return Err<RepairScript>("Cannot read " + archive_root.string() + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        const bool is_dir = it->is_directory(type_ec);
        if (type_ec) {
            return Err<RepairScript>("Cannot inspect " + it->path().string() + ": " + type_ec.message());
        }
        top_level.push_back(TopLevelEntry{it->path().filename().string(), is_dir});
    }
    if (ec) {
        return Err<RepairScript>("Listing of " + archive_root.string() + " failed: " + ec.message());
    }
    std::sort(top_level.begin(), top_level.end(),
              [](const TopLevelEntry& a, const TopLevelEntry& b) { return a.name < b.name; });

    scan::SourceScanner scanner;
    auto listing = scanner.scan(archive_root);
    if (listing.is_error()) {
        return Err<RepairScript>(listing.error());
    }

    std::vector<std::string> files;
    files.reserve(listing.value().files.size());
    for (const auto& file : listing.value().files) {
        files.push_back(file.relative_path);
    }

    return Ok(build(archive_root, top_level, files));
}

RepairScript StructureRepairPlanner::build(const fs::path& archive_root,
                                           const std::vector<TopLevelEntry>& top_level,
                                           const std::vector<std::string>& files) const {
    RepairScript script;

    for (const auto& entry : top_level) {
        if (entry.is_directory && !catalog::is_date_folder_name(entry.name)) {
            script.non_compliant_folders.push_back(entry.name);
        }
    }

    const std::set<std::string> existing(files.begin(), files.end());
    std::map<std::string, std::vector<RepairMove>> by_target;

    for (const auto& relative : files) {
        if (classifier_.classify(relative) != plan::FileClass::Managed) {
            continue;
        }
        ++script.managed_files;

        const fs::path path(relative);
        if (!path.has_parent_path()) {
            script.warnings.push_back("Managed file outside any date folder left in place: " + relative);
            continue;
        }

        auto component = path.begin();
        const std::string date_folder = component->string();
        if (!catalog::is_date_folder_name(date_folder)) {
            spdlog::debug("{} is not inside a date folder; leaving it", relative);
            continue;
        }

        // Compliant: {date folder}/{managed subfolder}/... at any depth
        ++component;
        const bool has_more = std::next(component) != path.end();
        if (has_more && component->string() == managed_subfolder_) {
            ++script.compliant_files;
            continue;
        }

        const std::string filename = path.filename().string();
        const std::string target_relative = date_folder + "/" + managed_subfolder_ + "/" + filename;
        if (existing.count(target_relative) > 0) {
            script.warnings.push_back("Not moving " + relative + ": " + target_relative + " already exists");
            continue;
        }

        RepairMove move;
        move.source = archive_root / path;
        move.target_dir = archive_root / date_folder / managed_subfolder_;
        move.target = move.target_dir / filename;
        by_target[target_relative].push_back(std::move(move));
    }

    for (auto& [target, moves] : by_target) {
        if (moves.size() > 1) {
            script.warnings.push_back("Not moving " + std::to_string(moves.size()) +
                                      " files that would all land on " + target);
            continue;
        }
        script.moves.push_back(std::move(moves.front()));
    }

    std::sort(script.moves.begin(), script.moves.end(),
              [](const RepairMove& a, const RepairMove& b) { return a.source < b.source; });

    if (!script.moves.empty()) {
        script.lines = render(script.moves);
    }
    return script;
}

std::vector<std::string> StructureRepairPlanner::render(const std::vector<RepairMove>& moves) const {
    std::vector<std::string> lines;
    lines.reserve(moves.size() * 2 + 3);
    lines.push_back("#!/usr/bin/env bash");
    lines.push_back("set -x");
    lines.push_back("");
    for (const auto& move : moves) {
        lines.push_back("mkdir -p " + shell_quote(move.target_dir.string()));
        lines.push_back("mv -- " + shell_quote(move.source.string()) + " " + shell_quote(move.target.string()));
    }
    return lines;
}

std::string StructureRepairPlanner::shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace ingest::repair
