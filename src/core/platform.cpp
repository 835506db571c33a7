#include "ingest/core/platform.hpp"

#ifdef INGEST_PLATFORM_WINDOWS
    #include <windows.h>
#else
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <cerrno>
#endif

namespace ingest {
namespace fs = std::filesystem;

namespace {

#ifdef INGEST_PLATFORM_WINDOWS
std::time_t filetime_to_time_t(const FILETIME& ft) {
    ULARGE_INTEGER value;
    value.LowPart = ft.dwLowDateTime;
    value.HighPart = ft.dwHighDateTime;
    // 100ns ticks since 1601-01-01
    constexpr unsigned long long kEpochDelta = 116444736000000000ULL;
    return static_cast<std::time_t>((value.QuadPart - kEpochDelta) / 10000000ULL);
}
#endif

} // namespace

std::optional<FileTimestamps> read_file_timestamps(const fs::path& path, std::error_code& ec) {
    ec.clear();
    FileTimestamps stamps;

#ifdef INGEST_PLATFORM_WINDOWS
    WIN32_FILE_ATTRIBUTE_DATA data;
    if (!GetFileAttributesExW(path.c_str(), GetFileExInfoStandard, &data)) {
        ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
        return std::nullopt;
    }
    stamps.created = filetime_to_time_t(data.ftCreationTime);
    stamps.modified = filetime_to_time_t(data.ftLastWriteTime);
#elif defined(INGEST_PLATFORM_LINUX) && defined(STATX_BTIME)
    struct statx stx {};
    if (statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME | STATX_MTIME, &stx) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
    stamps.modified = static_cast<std::time_t>(stx.stx_mtime.tv_sec);
    if ((stx.stx_mask & STATX_BTIME) != 0 && stx.stx_btime.tv_sec != 0) {
        stamps.created = static_cast<std::time_t>(stx.stx_btime.tv_sec);
    }
#else
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
    stamps.modified = st.st_mtime;
    #ifdef INGEST_PLATFORM_MACOS
    stamps.created = st.st_birthtimespec.tv_sec;
    #endif
#endif

    return stamps;
}

} // namespace ingest
