#pragma once

#include <string>

namespace ingest {

// ASCII-only lowercase. Extensions, card file names and prefixes are ASCII,
// so this stays locale-independent.
inline std::string to_lower_ascii(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c >= 'A' && c <= 'Z') {
            result += static_cast<char>(c + ('a' - 'A'));
        } else {
            result += c;
        }
    }
    return result;
}

inline bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace ingest
