#pragma once

#include "ingest/catalog/types.hpp"

#include <optional>
#include <string>

namespace ingest::catalog {

/**
 * @brief Leading `YYYY-MM-DD` of a top-level archive folder name
 *
 * Accepted names: `YYYY-MM-DD`, or that prefix followed by '-', ' ' or '/'
 * and an arbitrary suffix ("2024-10-11 Paris Trip", "2024-01-15-vacation").
 * Both the destination resolver and the structure repair planner use this
 * single definition. Returns nullopt for any other name.
 */
std::optional<std::string> date_folder_key(const std::string& name);

inline bool is_date_folder_name(const std::string& name) {
    return date_folder_key(name).has_value();
}

/// True when `name` is a date folder whose date prefix equals `date`
bool folder_owns_date(const std::string& name, const CalendarDate& date);

} // namespace ingest::catalog
