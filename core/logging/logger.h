#pragma once

#include "calendar/date.h"

#include <fstream>
#include <mutex>
#include <string>

namespace larder {

struct Insight;

// JSON-lines event log. Every record is one JSON object appended to the
// output file (if any) and echoed to stdout.
class Logger {
public:
    explicit Logger(const std::string& output_path, bool echo_stdout = true);
    ~Logger();

    void log_rollup(const std::string& period, const std::string& user_id,
                    const std::string& key, const std::string& status,
                    int entries, int days);
    void log_rollup_failure(const std::string& period, const std::string& user_id,
                            const std::string& key, const std::string& error);
    void log_backfill(const std::string& user_id, const DateRange& range,
                      int completed, int failed, int skipped);
    void log_insight(const Insight& insight);
    void log_rule_error(const std::string& rule_key, const std::string& error);
    void log_cache_invalidation(const std::string& user_id, std::size_t removed);
    void log_target_fallback(const std::string& user_id, const Date& date,
                             const std::string& error);

private:
    void write_line(const std::string& json);
    std::string timestamp_iso8601() const;

    std::ofstream file_;
    std::mutex mutex_;
    bool echo_stdout_;
};

} // namespace larder
