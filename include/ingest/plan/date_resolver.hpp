#pragma once

#include "ingest/catalog/types.hpp"
#include "ingest/core/config.hpp"
#include "ingest/core/platform.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ingest::plan {

enum class DateSource {
    Filename,
    CreationTime,
    ModificationTime
};

const char* to_string(DateSource source) noexcept;

struct ResolvedDate {
    catalog::CalendarDate date;
    DateSource source = DateSource::Filename;
};

/**
 * @brief Derives the archive date of a file
 *
 * PRECEDENCE:
 * 1. Date embedded in the name: `<PREFIX>_<YYYYMMDD>[<non-digit>...]`,
 *    e.g. VID_20241011_185020_00_003.insv -> 2024-10-11. Digit blocks that are
 *    not a real calendar date (20241341) do not count.
 * 2. Filesystem birth time, where the platform reports one.
 * 3. Last-modified time.
 */
class DateResolver {
public:
    explicit DateResolver(const IngestConfig& config);

    std::optional<catalog::CalendarDate> date_from_filename(const std::string& filename) const;

    ResolvedDate resolve(const std::string& filename, const FileTimestamps& timestamps) const;

private:
    std::vector<std::string> prefixes_;  ///< Lowercased, each ending in '_'
};

} // namespace ingest::plan
