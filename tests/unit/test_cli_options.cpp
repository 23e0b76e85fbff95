#include "cli/cli_options.h"

#include <gtest/gtest.h>

#include <vector>

using namespace larder;

static CliOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "larder");
    return parse_cli_args(static_cast<int>(args.size()), args.data());
}

TEST(CliOptions, ParsesEveryFlag) {
    auto opts = parse({"streaks", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                       "--to", "2024-01-14", "--workers", "4", "--weeks", "2",
                       "--nutrients", "iron_mg,,fiber_g", "--condition", "under",
                       "--log", "out.jsonl"});

    EXPECT_EQ(opts.command, "streaks");
    EXPECT_EQ(opts.data_path, "d.json");
    EXPECT_EQ(opts.user_id, "u1");
    EXPECT_EQ(opts.from, "2024-01-01");
    EXPECT_EQ(opts.to, "2024-01-14");
    EXPECT_EQ(opts.workers, 4);
    EXPECT_EQ(opts.weeks, 2);
    EXPECT_EQ(opts.nutrients, (std::vector<std::string>{"iron_mg", "fiber_g"}));
    EXPECT_EQ(opts.condition, StreakCondition::UNDER_GOAL);
    EXPECT_EQ(opts.log_path, "out.jsonl");
}

TEST(CliOptions, DefaultsWhenFlagsOmitted) {
    auto opts = parse({"backfill", "--data", "d.json", "--user", "u1", "--from", "2024-01-01"});
    EXPECT_EQ(opts.workers, 0);
    EXPECT_EQ(opts.weeks, 4);
    EXPECT_EQ(opts.condition, StreakCondition::MEETING_GOAL);
    EXPECT_TRUE(opts.nutrients.empty());
    EXPECT_EQ(opts.log_path, "larder.jsonl");
}

TEST(CliOptions, NonNumericCountsAreUsageErrors) {
    EXPECT_THROW(parse({"backfill", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                        "--workers", "x"}),
                 UsageError);
    EXPECT_THROW(parse({"weekly", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                        "--weeks", "3x"}),
                 UsageError);
    EXPECT_THROW(parse({"weekly", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                        "--weeks", "0"}),
                 UsageError);
    EXPECT_THROW(parse({"backfill", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                        "--workers", "99999999999999999999"}),
                 UsageError);
}

TEST(CliOptions, UnknownCommandRejectedBeforeOtherArguments) {
    EXPECT_THROW(parse({"bakfill", "--data", "d.json", "--user", "u1", "--from", "2024-01-01"}),
                 UsageError);
    EXPECT_FALSE(is_known_command("bakfill"));
    EXPECT_TRUE(is_known_command("insights"));
}

TEST(CliOptions, MissingOrUnknownArgumentsAreUsageErrors) {
    EXPECT_THROW(parse({}), UsageError);
    EXPECT_THROW(parse({"trends", "--user", "u1", "--from", "2024-01-01"}), UsageError);
    EXPECT_THROW(parse({"trends", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                        "--verbose"}),
                 UsageError);
    EXPECT_THROW(parse({"streaks", "--data", "d.json", "--user", "u1", "--from", "2024-01-01",
                        "--condition", "sometimes"}),
                 UsageError);
}
