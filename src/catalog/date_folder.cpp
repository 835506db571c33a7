#include "ingest/catalog/date_folder.hpp"

#include <regex>

namespace ingest::catalog {
namespace {

const std::regex& date_folder_pattern() {
    static const std::regex pattern(R"(^(\d{4}-\d{2}-\d{2})(?:[ /-].*)?$)");
    return pattern;
}

} // namespace

std::optional<std::string> date_folder_key(const std::string& name) {
    std::smatch match;
    if (!std::regex_match(name, match, date_folder_pattern())) {
        return std::nullopt;
    }
    return match[1].str();
}

bool folder_owns_date(const std::string& name, const CalendarDate& date) {
    const auto key = date_folder_key(name);
    return key && *key == date.to_string();
}

} // namespace ingest::catalog
