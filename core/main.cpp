#include "calendar/date.h"
#include "cli/cli_options.h"
#include "config/analytics_config.h"
#include "fault/fault_injector.h"
#include "fault/fault_profile.h"
#include "fault/faulty_repository.h"
#include "logging/logger.h"
#include "service/analytics_service.h"
#include "storage/json_codec.h"
#include "storage/json_fixture.h"
#include "storage/memory_repositories.h"
#include "targets/macro_calculator.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace larder;

static std::atomic<bool> cancel_requested{false};

static void signal_handler(int) {
    cancel_requested = true;
}

static void print_usage() {
    std::cerr << "usage: larder <backfill|trends|streaks|insights|target|weekly> "
                 "--data FILE --user ID --from YYYY-MM-DD [--to YYYY-MM-DD]\n"
                 "       [--config FILE] [--log FILE] [--faults FILE] [--workers N]\n"
                 "       [--nutrients a,b,c] [--condition meeting|exceeding|under] [--weeks N]\n";
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parse_cli_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "[larder] " << e.what() << "\n";
        print_usage();
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        AnalyticsConfig config = opts.config_path.empty() ? AnalyticsConfig{}
                                                          : AnalyticsConfig::load(opts.config_path);
        if (opts.workers > 0) {
            config.backfill_workers = static_cast<std::size_t>(opts.workers);
        }

        DateRange range{Date::parse(opts.from), Date::parse(opts.to.empty() ? opts.from : opts.to)};

        // Results go to stdout, so the event log stays in its file.
        Logger logger(opts.log_path, false);

        MemoryIntakeRepository intake;
        MemorySummaryRepository summaries;
        MemoryGoalLayerRepository layers;
        MemoryProfileRepository profiles;

        auto counts = load_fixture_file(opts.data_path, intake, layers, profiles);
        std::cerr << "[larder] loaded " << counts.intake << " intake record(s), "
                  << counts.goal_layers << " goal layer(s), "
                  << counts.profiles << " profile(s) from " << opts.data_path << "\n";

        FaultInjector injector;
        if (!opts.faults_path.empty()) {
            auto faults = FaultProfile::load(opts.faults_path);
            FaultProfile::apply(faults, injector);
            std::cerr << "[larder] loaded " << faults.size() << " fault(s) from "
                      << opts.faults_path << "\n";
            for (const auto& fc : faults) {
                std::cerr << "[larder]   " << to_string(fc.type) << " on " << fc.key << "\n";
            }
        }
        FaultyIntakeRepository faulty_intake(intake, injector);
        FaultySummaryRepository faulty_summaries(summaries, injector);

        MifflinStJeorCalculator calculator;
        AnalyticsService service(faulty_intake, faulty_summaries, layers, profiles,
                                 calculator, config, &logger);

        const auto& keys = opts.nutrients.empty() ? config.insights.trend_nutrients
                                                  : opts.nutrients;
        const auto& user_id = opts.user_id;
        const auto& command = opts.command;

        if (command == "target") {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& [date, targets] :
                 service.resolver().get_range(user_id, range.start, range.end)) {
                out.push_back({{"date", date.to_string()}, {"targets", encode(targets)}});
            }
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        auto report = service.backfill(user_id, range, &cancel_requested);
        std::cerr << "[larder] backfill: " << report.written << " written, "
                  << report.empty << " empty, " << report.failed << " failed, "
                  << report.cancelled << " cancelled\n";
        for (const auto& f : report.failures) {
            std::cerr << "[larder]   " << to_string(f.period) << " " << f.key
                      << ": " << f.error << "\n";
        }
        if (cancel_requested) {
            std::cerr << "[larder] interrupted\n";
            return 130;
        }

        nlohmann::json out = nlohmann::json::array();

        if (command == "backfill") {
            for (const auto& row : summaries.find_daily_range(user_id, range.start, range.end)) {
                out.push_back(encode(row));
            }
        } else if (command == "trends") {
            for (const auto& trend : service.compute_trends(user_id, range, keys)) {
                out.push_back(encode(trend));
            }
        } else if (command == "streaks") {
            for (const auto& streak : service.compute_streaks(user_id, range, keys,
                                                              opts.condition)) {
                out.push_back(encode(streak));
            }
        } else if (command == "insights") {
            for (const auto& insight : service.evaluate_insights(user_id, range)) {
                out.push_back(encode(insight));
            }
        } else if (command == "weekly") {
            for (const auto& row : service.weekly_averages(user_id, range.end, opts.weeks)) {
                out.push_back(encode(row));
            }
        }

        std::cout << out.dump(2) << "\n";
        return report.failed > 0 ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "[larder] error: " << e.what() << "\n";
        return 1;
    }
}
