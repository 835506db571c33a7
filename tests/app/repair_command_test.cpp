#include "ingest/app/commands.hpp"
#include "ingest/app/options.hpp"

#include "../support/test_fs.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace fs = std::filesystem;
using ingest::app::kExitOk;
using ingest::app::kExitUsage;
using ingest::app::run_repair;
using ingest::testing::ScopedPermissions;
using ingest::testing::TempDir;
using ingest::testing::list_tree;
using ingest::testing::write_file;

namespace {

struct RunOutput {
    int code = -1;
    std::string out;
    std::string err;
};

RunOutput repair(std::vector<std::string> args) {
    std::ostringstream out;
    std::ostringstream err;
    args.push_back("--log-level");
    args.push_back("off");
    RunOutput result;
    result.code = run_repair(args, out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST(RepairCommand, PrintsScriptWithoutTouchingArchive) {
    TempDir archive("ingest_repair_app");
    write_file(archive / "2024-01-15/VID_20240115_120000_00_001.insv", "x");
    write_file(archive / "2024-01-15 Trip/Camera01/IMG_20240115_120000_00_002.insp", "y");
    fs::create_directories(archive / "Old Stuff");

    const auto before = list_tree(archive.path());
    auto run = repair({archive.path().string()});

    EXPECT_EQ(run.code, kExitOk) << run.err;
    EXPECT_EQ(list_tree(archive.path()), before);
    EXPECT_EQ(run.out.rfind("#!/usr/bin/env bash\nset -x\n", 0), 0u);
    EXPECT_TRUE(contains(run.out, "mkdir -p '" + (archive.path() / "2024-01-15/insta360").string() + "'"));
    EXPECT_TRUE(contains(run.out, "mv -- '" + (archive.path() / "2024-01-15 Trip/Camera01").string()));
    EXPECT_TRUE(contains(run.err, "# 2 files to move"));
    EXPECT_TRUE(contains(run.err, "Warning: Non-compliant folders found in root:\n  Old Stuff\n"));
}

TEST(RepairCommand, AlreadyCompliant) {
    TempDir archive("ingest_repair_app");
    write_file(archive / "2024-01-15/insta360/VID_20240115_120000_00_001.insv", "x");

    auto run = repair({archive.path().string()});
    EXPECT_EQ(run.code, kExitOk);
    EXPECT_TRUE(run.out.empty());
    EXPECT_TRUE(contains(run.err, "# All Insta360 files are already compliant."));
}

TEST(RepairCommand, NothingManaged) {
    TempDir archive("ingest_repair_app");
    write_file(archive / "2024-01-15/photo.jpg", "x");

    auto run = repair({archive.path().string()});
    EXPECT_EQ(run.code, kExitOk);
    EXPECT_TRUE(run.out.empty());
    EXPECT_TRUE(contains(run.err, "# No Insta360 files found in archive directory."));
}

TEST(RepairCommand, UnreadableDateFolderProducesNoScript) {
    TempDir archive("ingest_repair_app");
    write_file(archive / "2024-01-15/VID_20240115_120000_00_001.insv", "x");
    write_file(archive / "2024-01-16/VID_20240116_120000_00_001.insv", "y");

    RunOutput run;
    {
        ScopedPermissions locked(archive / "2024-01-16", fs::perms::none);
        if (!locked.enforced()) {
            GTEST_SKIP() << "directory permissions are not enforced for this user";
        }
        run = repair({archive.path().string()});
    }

    EXPECT_EQ(run.code, kExitUsage);
    EXPECT_TRUE(run.out.empty()) << run.out;
    EXPECT_TRUE(contains(run.err, "Incomplete scan")) << run.err;
}

TEST(RepairCommand, UsageAndValidation) {
    TempDir archive("ingest_repair_app");
    EXPECT_EQ(repair({}).code, kExitUsage);
    EXPECT_EQ(repair({"a", "b"}).code, kExitUsage);
    EXPECT_EQ(repair({archive.path().string(), "--approve"}).code, kExitUsage);
    EXPECT_EQ(repair({(archive / "absent").string()}).code, kExitUsage);

    auto help = repair({"-h"});
    EXPECT_EQ(help.code, kExitOk);
    EXPECT_TRUE(contains(help.out, "Usage: repair_structure"));
}
