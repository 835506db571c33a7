#include "ingest/scan/source_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace ingest::scan {
namespace fs = std::filesystem;

Result<ScanResult> SourceScanner::scan(const fs::path& root) const {
    ScanResult result;

    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return Err<ScanResult>(std::string("Not a directory: ") + root.string());
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Err<ScanResult>("Cannot read " + root.string() + ": " + ec.message());
    }

    std::vector<std::string> problems;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        const auto relative = entry.path().lexically_relative(root);

        std::error_code entry_ec;
        const bool regular = entry.is_regular_file(entry_ec);
        if (entry_ec) {
            problems.push_back("cannot stat " + relative.generic_string() + ": " + entry_ec.message());
            continue;
        }
        if (!regular) {
            continue;
        }

        catalog::SourceFile file;
        file.absolute_path = entry.path();
        file.relative_path = relative.generic_string();
        file.subtree = top_level_subtree(relative);

        file.size_bytes = entry.file_size(entry_ec);
        if (entry_ec) {
            problems.push_back("cannot read size of " + file.relative_path + ": " + entry_ec.message());
            continue;
        }

        auto stamps = read_file_timestamps(entry.path(), entry_ec);
        if (!stamps) {
            problems.push_back("cannot read timestamps of " + file.relative_path + ": " + entry_ec.message());
            continue;
        }
        file.timestamps = *stamps;

        result.files.push_back(std::move(file));
    }
    if (ec) {
        problems.push_back("listing stopped early: " + ec.message());
    }

    if (!problems.empty()) {
        std::string message = "Incomplete scan of " + root.string();
        for (const auto& problem : problems) {
            message += "; " + problem;
        }
        spdlog::debug("{}", message);
        return Err<ScanResult>(message);
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const catalog::SourceFile& a, const catalog::SourceFile& b) {
                  return a.relative_path < b.relative_path;
              });

    spdlog::info("Scanned {}: {} files", root.string(), result.files.size());
    return Ok(result);
}

std::string SourceScanner::top_level_subtree(const fs::path& relative) {
    if (!relative.has_parent_path()) {
        return ".";
    }
    return relative.begin()->string();
}

} // namespace ingest::scan
