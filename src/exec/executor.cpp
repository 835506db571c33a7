#include "ingest/exec/executor.hpp"

#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace ingest::exec {
namespace fs = std::filesystem;
using catalog::PlanAction;
using catalog::PlanEntry;

namespace {

std::string describe(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return what + " " + path.string() + ": " + ec.message();
}

} // namespace

Executor::Executor(events::EventBus& bus, bool approved)
    : bus_(bus), approved_(approved) {}

void Executor::run(const std::vector<PlanEntry>& entries) {
    for (const auto& entry : entries) {
        if (catalog::is_error(entry.action)) {
            bus_.emit(events::EntryRejectedEvent{entry});
            continue;
        }
        if (entry.action == PlanAction::SkipIdenticalSize) {
            bus_.emit(events::FileSkippedEvent{entry});
            continue;
        }
        if (!approved_) {
            bus_.emit(events::TransferPlannedEvent{entry});
            continue;
        }

        const auto started = std::chrono::steady_clock::now();
        auto result = apply(entry);
        if (result.is_error()) {
            bus_.emit(events::TransferFailedEvent{entry, result.error()});
            continue;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        bus_.emit(events::FileTransferredEvent{entry, entry.file.size_bytes, elapsed});
    }
}

Result<void> Executor::apply(const PlanEntry& entry) const {
    if (!catalog::is_transfer(entry.action)) {
        return Err<void>(std::string("Entry is not a transfer: ") + catalog::to_string(entry.action));
    }
    if (!approved_) {
        return Err<void>(std::string("Refusing to modify the destination without approval"));
    }

    const auto& source = entry.file.source_path;
    const auto& destination = entry.destination_path;

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Err<void>("Source vanished: " + source.string());
    }

    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return res;
    }

    return entry.action == PlanAction::Move ? move_file(source, destination)
                                            : copy_file(source, destination);
}

Result<void> Executor::copy_file(const fs::path& source, const fs::path& destination) {
    // Stage next to the destination so an interrupted copy never replaces
    // an archived file with a truncated one.
    fs::path staging = destination;
    staging += kPartialSuffix;

    std::error_code ec;
    fs::copy_file(source, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        return Err<void>(describe("Failed to copy", source, ec));
    }

    const auto expected = fs::file_size(source, ec);
    const auto written = ec ? 0 : fs::file_size(staging, ec);
    if (ec || written != expected) {
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        return Err<void>("Size mismatch after copying " + source.string());
    }

    const auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(staging, mtime, ec);
    }
    if (ec) {
        spdlog::warn("Could not preserve modification time of {}: {}", source.string(), ec.message());
    }

    fs::rename(staging, destination, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        return Err<void>(describe("Failed to finalize", destination, ec));
    }
    return Ok();
}

Result<void> Executor::move_file(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return Ok();
    }
    if (ec != std::errc::cross_device_link) {
        return Err<void>(describe("Failed to move", source, ec));
    }

    spdlog::debug("{} is on another device; copying then removing", source.string());
    return copy_then_remove(source, destination);
}

Result<void> Executor::copy_then_remove(const fs::path& source, const fs::path& destination) {
    if (auto res = copy_file(source, destination); res.is_error()) {
        return res;
    }
    std::error_code ec;
    fs::remove(source, ec);
    if (ec) {
        return Err<void>(describe("Copied but could not remove source", source, ec));
    }
    return Ok();
}

Result<void> Executor::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    std::error_code dir_ec;
    if (ec && !fs::is_directory(parent, dir_ec)) {
        return Err<void>(describe("Failed to create directory", parent, ec));
    }
    return Ok();
}

} // namespace ingest::exec
