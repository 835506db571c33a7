#include "ingest/plan/date_resolver.hpp"

#include "ingest/core/strings.hpp"

#include <cctype>

namespace ingest::plan {
namespace {

constexpr std::size_t kDateDigits = 8;

int parse_digits(const std::string& text, std::size_t pos, std::size_t count) {
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // namespace

const char* to_string(DateSource source) noexcept {
    switch (source) {
        case DateSource::Filename: return "filename";
        case DateSource::CreationTime: return "creation time";
        case DateSource::ModificationTime: return "modification time";
    }
    return "unknown";
}

DateResolver::DateResolver(const IngestConfig& config) {
    prefixes_.reserve(config.date_prefixes.size());
    for (const auto& prefix : config.date_prefixes) {
        prefixes_.push_back(to_lower_ascii(prefix) + "_");
    }
}

std::optional<catalog::CalendarDate> DateResolver::date_from_filename(const std::string& filename) const {
    const std::string lower = to_lower_ascii(filename);

    for (const auto& prefix : prefixes_) {
        if (!starts_with(lower, prefix)) {
            continue;
        }
        const std::size_t start = prefix.size();
        if (lower.size() < start + kDateDigits) {
            continue;
        }

        bool all_digits = true;
        for (std::size_t i = start; i < start + kDateDigits; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(lower[i]))) {
                all_digits = false;
                break;
            }
        }
        if (!all_digits) {
            continue;
        }

        // A ninth digit means this is not an 8-digit date block
        const std::size_t end = start + kDateDigits;
        if (end < lower.size() && std::isdigit(static_cast<unsigned char>(lower[end]))) {
            continue;
        }

        auto date = catalog::CalendarDate::from_ymd(parse_digits(lower, start, 4),
                                                    parse_digits(lower, start + 4, 2),
                                                    parse_digits(lower, start + 6, 2));
        if (date) {
            return date;
        }
    }
    return std::nullopt;
}

ResolvedDate DateResolver::resolve(const std::string& filename, const FileTimestamps& timestamps) const {
    if (auto date = date_from_filename(filename)) {
        return ResolvedDate{*date, DateSource::Filename};
    }
    const DateSource source = timestamps.created ? DateSource::CreationTime : DateSource::ModificationTime;
    return ResolvedDate{catalog::CalendarDate::from_time_t(timestamps.best_creation_time()), source};
}

} // namespace ingest::plan
