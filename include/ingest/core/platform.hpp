#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <system_error>

#ifdef _WIN32
    #define INGEST_PLATFORM_WINDOWS
#elif defined(__APPLE__)
    #define INGEST_PLATFORM_MACOS
#else
    #define INGEST_PLATFORM_LINUX
#endif

namespace ingest {

/**
 * @brief Timestamps the filesystem reports for one file
 *
 * `created` is only populated where the OS exposes a birth time
 * (statx on Linux, st_birthtimespec on macOS, the creation time on Windows)
 * and the underlying filesystem records one.
 */
struct FileTimestamps {
    std::optional<std::time_t> created;
    std::time_t modified = 0;

    /// Best available creation-like timestamp: birth time, else last write.
    std::time_t best_creation_time() const noexcept {
        return created.value_or(modified);
    }
};

/**
 * @brief Query birth and modification time of `path`
 *
 * Only this function differs per target OS; everything that consumes the
 * timestamps is platform-agnostic.
 */
std::optional<FileTimestamps> read_file_timestamps(const std::filesystem::path& path,
                                                   std::error_code& ec);

} // namespace ingest
