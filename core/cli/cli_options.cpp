#include "cli/cli_options.h"

#include <cstring>
#include <sstream>

namespace larder {

namespace {

const char* const kCommands[] = {"backfill", "trends", "streaks", "insights", "target", "weekly"};

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

int parse_positive(const char* flag, const std::string& value) {
    std::size_t consumed = 0;
    int n = 0;
    try {
        n = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw UsageError(std::string(flag) + " expects a positive integer, got '" + value + "'");
    }
    if (consumed != value.size() || n <= 0) {
        throw UsageError(std::string(flag) + " expects a positive integer, got '" + value + "'");
    }
    return n;
}

StreakCondition parse_condition(const std::string& s) {
    if (s == "meeting")   return StreakCondition::MEETING_GOAL;
    if (s == "exceeding") return StreakCondition::EXCEEDING_GOAL;
    if (s == "under")     return StreakCondition::UNDER_GOAL;
    throw UsageError("unknown streak condition: " + s);
}

} // namespace

bool is_known_command(const std::string& command) {
    for (const char* known : kCommands) {
        if (command == known) {
            return true;
        }
    }
    return false;
}

CliOptions parse_cli_args(int argc, const char* const argv[]) {
    if (argc < 2) {
        throw UsageError("missing command");
    }

    CliOptions opts;
    opts.command = argv[1];
    if (!is_known_command(opts.command)) {
        throw UsageError("unknown command: " + opts.command);
    }

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_path = argv[++i];
        } else if (std::strcmp(argv[i], "--data") == 0 && i + 1 < argc) {
            opts.data_path = argv[++i];
        } else if (std::strcmp(argv[i], "--faults") == 0 && i + 1 < argc) {
            opts.faults_path = argv[++i];
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            opts.user_id = argv[++i];
        } else if (std::strcmp(argv[i], "--from") == 0 && i + 1 < argc) {
            opts.from = argv[++i];
        } else if (std::strcmp(argv[i], "--to") == 0 && i + 1 < argc) {
            opts.to = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            opts.workers = parse_positive("--workers", argv[++i]);
        } else if (std::strcmp(argv[i], "--nutrients") == 0 && i + 1 < argc) {
            opts.nutrients = split_csv(argv[++i]);
        } else if (std::strcmp(argv[i], "--condition") == 0 && i + 1 < argc) {
            opts.condition = parse_condition(argv[++i]);
        } else if (std::strcmp(argv[i], "--weeks") == 0 && i + 1 < argc) {
            opts.weeks = parse_positive("--weeks", argv[++i]);
        } else {
            throw UsageError(std::string("unknown argument: ") + argv[i]);
        }
    }

    if (opts.data_path.empty() || opts.user_id.empty() || opts.from.empty()) {
        throw UsageError("--data, --user and --from are required");
    }
    return opts;
}

} // namespace larder
