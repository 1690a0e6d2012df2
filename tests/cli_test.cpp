// cli_test.cpp — argument parsing for the annocal tool

#include <gtest/gtest.h>

#include "cli.hpp"

#include <vector>

namespace {
Args parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "annocal");
    return parse_cli((int)argv.size(), argv.data());
}
}

TEST(CliTest, ResolveMode) {
    Args a = parse({"resolve", "Due 3 Oct", "--posted", "2024-01-05T09:00:00Z", "--course", "CS 363"});
    EXPECT_EQ(a.mode, "resolve");
    EXPECT_EQ(a.text, "Due 3 Oct");
    EXPECT_EQ(a.posted, "2024-01-05T09:00:00Z");
    EXPECT_EQ(a.course, "CS 363");
    EXPECT_TRUE(a.timetable_file.empty());
}

TEST(CliTest, SyncModeDefaults) {
    Args a = parse({"sync", "export.json"});
    EXPECT_EQ(a.feed_path, "export.json");
    EXPECT_EQ(a.out_path, "my_schedule.ics");
    EXPECT_EQ(a.lookback_days, 30);
}

TEST(CliTest, SyncModeFlags) {
    Args a = parse({"sync", "export.json", "--out", "cal.ics", "--lookback-days", "7",
                    "--timetable-file", "tt.json"});
    EXPECT_EQ(a.out_path, "cal.ics");
    EXPECT_EQ(a.lookback_days, 7);
    EXPECT_EQ(a.timetable_file, "tt.json");
}

TEST(CliTest, UsageErrors) {
    EXPECT_THROW((parse({})), UsageError);
    EXPECT_THROW((parse({"index", "x"})), UsageError);
    EXPECT_THROW((parse({"resolve", "text"})), UsageError);
    EXPECT_THROW((parse({"resolve", "text", "--posted"})), UsageError);
    EXPECT_THROW((parse({"sync", "export.json", "--posted", "2024-01-05"})), UsageError);
    EXPECT_THROW((parse({"sync", "export.json", "--lookback-days", "7x"})), UsageError);
    EXPECT_THROW((parse({"sync", "export.json", "--lookback-days", "-1"})), UsageError);
}
