#pragma once

/**
 * @file types.hpp
 * @brief Core value types for the card ingest pipeline
 *
 * WHAT THIS FILE HOLDS:
 * The data that flows between the placement stages. None of these types
 * touch the filesystem; they are produced by the scanner/planner and
 * consumed by the executor and the report.
 *
 * HOW IT INTEGRATES:
 * - Scanner (scan/source_scanner.hpp) produces SourceFile records
 * - Planner (plan/*.hpp) turns them into ManagedFile + PlanEntry
 * - Executor (exec/executor.hpp) applies Copy/Move entries
 * - Report (report/report.hpp) prints entries and the summary
 *
 * DESIGN DECISIONS:
 * - CalendarDate has no time component; time of day is dropped as soon as a
 *   timestamp is converted.
 * - PlanEntry carries the error kinds alongside the actions so the plan is a
 *   complete per-file record and nothing is dropped silently.
 */

#include "ingest/core/platform.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest {
namespace catalog {

/**
 * @brief Year-month-day without a time component
 *
 * EXAMPLE:
 * CalendarDate{2024, 10, 11}.to_string() == "2024-10-11"
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /// True when the fields name a real day of the Gregorian calendar
    bool is_valid() const noexcept;

    /// Canonical `YYYY-MM-DD` form used for folder names
    std::string to_string() const;

    /// Build from separate fields, rejecting impossible dates (e.g. 2023-02-29)
    static std::optional<CalendarDate> from_ymd(int year, int month, int day);

    /// Local calendar date of a POSIX timestamp
    static CalendarDate from_time_t(std::time_t timestamp);

    bool operator==(const CalendarDate& other) const noexcept {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const noexcept { return !(*this == other); }
    bool operator<(const CalendarDate& other) const noexcept {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

/**
 * @brief One regular file found while enumerating the source tree
 *
 * `relative_path` is relative to the source root and uses generic ('/')
 * separators; `subtree` is its first component, or "." for files directly
 * in the root.
 */
struct SourceFile {
    std::filesystem::path absolute_path;
    std::string relative_path;
    std::string subtree;
    std::uint64_t size_bytes = 0;
    FileTimestamps timestamps;
};

/**
 * @brief A source file that belongs to the managed format family
 *
 * Created during classification and not modified afterwards.
 */
struct ManagedFile {
    std::filesystem::path source_path;
    std::string filename;
    std::string subtree;
    std::uint64_t size_bytes = 0;
    CalendarDate resolved_date;
};

/**
 * @brief A top-level destination folder that owns one calendar date
 *
 * `name` is the folder name verbatim (e.g. "2024-10-11 Paris Trip"), or the
 * bare date when the resolver proposes a new folder.
 */
struct ArchiveDateFolder {
    CalendarDate date;
    std::string name;
    std::filesystem::path path;
};

enum class PlanAction {
    Copy,
    Move,
    SkipIdenticalSize,
    ErrorDuplicateName,
    ErrorAmbiguousDateFolder,
    ErrorDestinationUnreadable
};

const char* to_string(PlanAction action) noexcept;

inline bool is_transfer(PlanAction action) noexcept {
    return action == PlanAction::Copy || action == PlanAction::Move;
}

inline bool is_error(PlanAction action) noexcept {
    return action == PlanAction::ErrorDuplicateName || action == PlanAction::ErrorAmbiguousDateFolder ||
           action == PlanAction::ErrorDestinationUnreadable;
}

/**
 * @brief The decided action for one managed file
 *
 * `destination_path` is empty for ErrorAmbiguousDateFolder (there is no
 * single folder to point at). `existing_size` is set when something with the
 * same name already sits at the destination; a Copy/Move with
 * `existing_size` set therefore overwrites an entry of a different size.
 * `detail` holds the human-readable error context (conflicting subtrees,
 * candidate folders or the filesystem error that hid the destination).
 */
struct PlanEntry {
    ManagedFile file;
    std::filesystem::path destination_path;
    PlanAction action = PlanAction::Copy;
    std::optional<std::uint64_t> existing_size;
    std::string detail;

    bool overwrites_existing() const noexcept {
        return is_transfer(action) && existing_size.has_value();
    }
};

} // namespace catalog
} // namespace ingest
