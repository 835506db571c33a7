#include "ingest/catalog/types.hpp"

#include <iomanip>
#include <sstream>

namespace ingest::catalog {
namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

} // namespace

bool CalendarDate::is_valid() const noexcept {
    if (year < 1 || year > 9999 || month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

std::string CalendarDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return oss.str();
}

std::optional<CalendarDate> CalendarDate::from_ymd(int year, int month, int day) {
    CalendarDate date{year, month, day};
    if (!date.is_valid()) {
        return std::nullopt;
    }
    return date;
}

CalendarDate CalendarDate::from_time_t(std::time_t timestamp) {
    std::tm local{};
#ifdef INGEST_PLATFORM_WINDOWS
    localtime_s(&local, &timestamp);
#else
    localtime_r(&timestamp, &local);
#endif
    return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

const char* to_string(PlanAction action) noexcept {
    switch (action) {
        case PlanAction::Copy: return "copy";
        case PlanAction::Move: return "move";
        case PlanAction::SkipIdenticalSize: return "skip-identical-size";
        case PlanAction::ErrorDuplicateName: return "error-duplicate-name";
        case PlanAction::ErrorAmbiguousDateFolder: return "error-ambiguous-date-folder";
        case PlanAction::ErrorDestinationUnreadable: return "error-destination-unreadable";
    }
    return "unknown";
}

} // namespace ingest::catalog
