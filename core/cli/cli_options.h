#pragma once

#include "trends/trend_analyzer.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace larder {

// Bad command line; the CLI prints usage and exits with 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::string command;
    std::string config_path;
    std::string log_path = "larder.jsonl";
    std::string data_path;
    std::string faults_path;
    std::string user_id;
    std::string from;
    std::string to;
    std::vector<std::string> nutrients;  // empty: configured trend nutrients
    StreakCondition condition = StreakCondition::MEETING_GOAL;
    int workers = 0;                     // 0: configured backfill_workers
    int weeks = 4;
};

bool is_known_command(const std::string& command);

// argv[1] is the command. Throws UsageError on an unknown command or flag,
// a malformed value, or a missing --data/--user/--from.
CliOptions parse_cli_args(int argc, const char* const argv[]);

} // namespace larder
