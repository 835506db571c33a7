#include "ingest/exec/executor.hpp"

#include "ingest/events/components.hpp"

#include "../support/test_fs.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace fs = std::filesystem;
using ingest::catalog::PlanAction;
using ingest::catalog::PlanEntry;
using ingest::events::EventBus;
using ingest::events::RunTally;
using ingest::exec::Executor;
using ingest::testing::TempDir;
using ingest::testing::read_file;
using ingest::testing::write_file;

namespace {

PlanEntry make_entry(const fs::path& source, const fs::path& destination, PlanAction action) {
    PlanEntry entry;
    entry.file.source_path = source;
    entry.file.filename = source.filename().string();
    std::error_code ec;
    entry.file.size_bytes = fs::exists(source, ec) ? fs::file_size(source) : 0;
    entry.destination_path = destination;
    entry.action = action;
    return entry;
}

} // namespace

TEST(Executor, CopyCreatesParentsAndKeepsSource) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "payload");

    EventBus bus;
    RunTally tally(bus);
    Executor executor(bus, true);
    const auto dest = dst / "2024-10-11/insta360/a.insv";
    executor.run({make_entry(src / "a.insv", dest, PlanAction::Copy)});

    EXPECT_EQ(read_file(dest), "payload");
    EXPECT_TRUE(fs::exists(src / "a.insv"));
    EXPECT_FALSE(fs::exists(dest.string() + Executor::kPartialSuffix));
    EXPECT_EQ(tally.stats().transferred, 1u);
    EXPECT_EQ(tally.stats().bytes_transferred, 7u);
}

TEST(Executor, CopyPreservesModificationTime) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "payload");
    const auto old_time = fs::last_write_time(src / "a.insv") - std::chrono::hours(48);
    fs::last_write_time(src / "a.insv", old_time);

    EventBus bus;
    Executor executor(bus, true);
    const auto dest = dst / "d/a.insv";
    ASSERT_TRUE(executor.apply(make_entry(src / "a.insv", dest, PlanAction::Copy)).is_ok());

    EXPECT_EQ(fs::last_write_time(dest), old_time);
}

TEST(Executor, CopyOverwritesExistingDestination) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "longer payload");
    write_file(dst / "d/a.insv", "short");

    EventBus bus;
    Executor executor(bus, true);
    ASSERT_TRUE(executor.apply(make_entry(src / "a.insv", dst / "d/a.insv", PlanAction::Copy)).is_ok());
    EXPECT_EQ(read_file(dst / "d/a.insv"), "longer payload");
}

TEST(Executor, MoveRemovesSource) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "payload");

    EventBus bus;
    Executor executor(bus, true);
    const auto dest = dst / "2024-10-11/insta360/a.insv";
    ASSERT_TRUE(executor.apply(make_entry(src / "a.insv", dest, PlanAction::Move)).is_ok());

    EXPECT_EQ(read_file(dest), "payload");
    EXPECT_FALSE(fs::exists(src / "a.insv"));
}

TEST(Executor, WithoutApprovalNothingIsWritten) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "payload");

    EventBus bus;
    RunTally tally(bus);
    int planned = 0;
    bus.subscribe<ingest::events::TransferPlannedEvent>([&](const auto&) { planned++; });

    Executor executor(bus, false);
    const auto entry = make_entry(src / "a.insv", dst / "d/a.insv", PlanAction::Copy);
    executor.run({entry});

    EXPECT_EQ(planned, 1);
    EXPECT_EQ(tally.stats().transferred, 1u);
    EXPECT_TRUE(ingest::testing::list_tree(dst.path()).empty());
    EXPECT_TRUE(executor.apply(entry).is_error());
}

TEST(Executor, FailureIsReportedAndRunContinues) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "b.insv", "bee");

    EventBus bus;
    RunTally tally(bus);
    std::string failure;
    bus.subscribe<ingest::events::TransferFailedEvent>(
        [&](const ingest::events::TransferFailedEvent& e) { failure = e.error_message; });

    Executor executor(bus, true);
    executor.run({make_entry(src / "missing.insv", dst / "d/missing.insv", PlanAction::Copy),
                  make_entry(src / "b.insv", dst / "d/b.insv", PlanAction::Copy)});

    EXPECT_NE(failure.find("missing.insv"), std::string::npos);
    EXPECT_EQ(tally.stats().failed, 1u);
    EXPECT_EQ(tally.stats().transferred, 1u);
    EXPECT_EQ(read_file(dst / "d/b.insv"), "bee");
}

TEST(Executor, SkipsAndErrorsEmitOneEventEach) {
    EventBus bus;
    RunTally tally(bus);
    Executor executor(bus, true);

    auto skip = make_entry("/nowhere/a.insv", "/nowhere/dest/a.insv", PlanAction::SkipIdenticalSize);
    auto dup = make_entry("/nowhere/b.insv", "", PlanAction::ErrorDuplicateName);
    auto ambiguous = make_entry("/nowhere/c.insv", "", PlanAction::ErrorAmbiguousDateFolder);
    executor.run({skip, dup, ambiguous});

    EXPECT_EQ(tally.stats().skipped, 1u);
    EXPECT_EQ(tally.stats().rejected, 2u);
    EXPECT_EQ(tally.stats().errors(), 2u);
    EXPECT_EQ(tally.stats().transferred, 0u);
}

TEST(Executor, ApplyRejectsNonTransfers) {
    EventBus bus;
    Executor executor(bus, true);
    auto entry = make_entry("/nowhere/a.insv", "/nowhere/dest/a.insv", PlanAction::SkipIdenticalSize);
    EXPECT_TRUE(executor.apply(entry).is_error());
}

TEST(Executor, CopyThenRemoveRelocatesAcrossFilesystems) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "payload");
    const auto dest = dst / "a.insv";

    auto result = Executor::copy_then_remove(src / "a.insv", dest);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(read_file(dest), "payload");
    EXPECT_FALSE(fs::exists(src / "a.insv"));
    EXPECT_FALSE(fs::exists(dest.string() + Executor::kPartialSuffix));
}

TEST(Executor, CopyThenRemoveKeepsSourceWhenCopyFails) {
    TempDir src("ingest_exec_src");
    TempDir dst("ingest_exec_dst");
    write_file(src / "a.insv", "payload");

    // Parent directory is missing, so staging the copy fails
    const auto dest = dst / "missing/a.insv";
    auto result = Executor::copy_then_remove(src / "a.insv", dest);
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(read_file(src / "a.insv"), "payload");
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_FALSE(fs::exists(dest.string() + Executor::kPartialSuffix));
}
