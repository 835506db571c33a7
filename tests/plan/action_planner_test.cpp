#include "ingest/plan/action_planner.hpp"

#include "../support/in_memory_archive.hpp"

#include <gtest/gtest.h>

using ingest::IngestConfig;
using ingest::catalog::CalendarDate;
using ingest::catalog::ManagedFile;
using ingest::catalog::PlanAction;
using ingest::plan::ActionPlanner;
using ingest::plan::DestinationResolver;
using ingest::plan::TransferMode;
using ingest::testing::InMemoryArchiveView;

namespace {

ManagedFile make_file(const std::string& name, std::uint64_t size) {
    ManagedFile file;
    file.source_path = "/src/cardA/" + name;
    file.filename = name;
    file.subtree = "cardA";
    file.size_bytes = size;
    file.resolved_date = CalendarDate{2024, 10, 11};
    return file;
}

const char* kDest = "/archive/2024-10-11/insta360/VID_20241011_185020_00_003.insv";

} // namespace

TEST(ActionPlanner, CopyWhenNothingExists) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Copy);
    InMemoryArchiveView archive;

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 10), archive);
    EXPECT_EQ(entry.action, PlanAction::Copy);
    EXPECT_EQ(entry.destination_path, std::filesystem::path(kDest));
    EXPECT_FALSE(entry.existing_size.has_value());
    EXPECT_FALSE(entry.overwrites_existing());
}

TEST(ActionPlanner, MoveMode) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Move);
    InMemoryArchiveView archive;

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 10), archive);
    EXPECT_EQ(entry.action, PlanAction::Move);
}

TEST(ActionPlanner, SameSizeIsSkipped) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Copy);
    InMemoryArchiveView archive;
    archive.add_folder("2024-10-11").add_file(kDest, 10);

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 10), archive);
    EXPECT_EQ(entry.action, PlanAction::SkipIdenticalSize);
    EXPECT_EQ(entry.existing_size, 10u);
}

TEST(ActionPlanner, DifferentSizeOverwrites) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Copy);
    InMemoryArchiveView archive;
    archive.add_folder("2024-10-11").add_file(kDest, 10);

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 11), archive);
    EXPECT_EQ(entry.action, PlanAction::Copy);
    EXPECT_EQ(entry.existing_size, 10u);
    EXPECT_TRUE(entry.overwrites_existing());
}

TEST(ActionPlanner, SameFileIsNeverCopiedOntoItself) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Copy);
    InMemoryArchiveView archive;
    archive.add_folder("2024-10-11").add_file(kDest, 10);

    auto file = make_file("VID_20241011_185020_00_003.insv", 12);
    file.source_path = kDest;
    auto entry = planner.plan(file, archive);
    EXPECT_EQ(entry.action, PlanAction::SkipIdenticalSize);
    EXPECT_FALSE(entry.detail.empty());
}

TEST(ActionPlanner, NonRegularDestinationStillTransfers) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Copy);
    InMemoryArchiveView archive;
    archive.add_folder("2024-10-11").add_directory_at(kDest);

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 10), archive);
    EXPECT_EQ(entry.action, PlanAction::Copy);
    EXPECT_FALSE(entry.detail.empty());
}

TEST(ActionPlanner, AmbiguousDateFolder) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Copy);
    InMemoryArchiveView archive;
    archive.add_folder("2024-10-11").add_folder("2024-10-11-dup");

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 10), archive);
    EXPECT_EQ(entry.action, PlanAction::ErrorAmbiguousDateFolder);
    EXPECT_TRUE(entry.destination_path.empty());
    EXPECT_NE(entry.detail.find("2024-10-11-dup"), std::string::npos);
}

TEST(ActionPlanner, UnreadableDestinationIsAnError) {
    DestinationResolver resolver{IngestConfig{}};
    ActionPlanner planner(resolver, TransferMode::Move);
    InMemoryArchiveView archive;
    archive.add_folder("2024-10-11").add_unreadable(kDest, "Cannot read size of clip: Permission denied");

    auto entry = planner.plan(make_file("VID_20241011_185020_00_003.insv", 10), archive);
    EXPECT_EQ(entry.action, PlanAction::ErrorDestinationUnreadable);
    EXPECT_TRUE(ingest::catalog::is_error(entry.action));
    EXPECT_FALSE(entry.overwrites_existing());
    EXPECT_EQ(entry.detail, "Cannot read size of clip: Permission denied");
}
