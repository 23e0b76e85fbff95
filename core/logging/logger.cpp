#include "logging/logger.h"

#include "insights/insight.h"

#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>

namespace larder {

Logger::Logger(const std::string& output_path, bool echo_stdout)
    : echo_stdout_(echo_stdout) {
    if (!output_path.empty()) {
        file_.open(output_path, std::ios::app);
    }
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log_rollup(const std::string& period, const std::string& user_id,
                        const std::string& key, const std::string& status,
                        int entries, int days) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "rollup";
    j["period"] = period;
    j["user"] = user_id;
    j["key"] = key;
    j["status"] = status;
    j["entries"] = entries;
    j["days"] = days;
    write_line(j.dump());
}

void Logger::log_rollup_failure(const std::string& period,
                                const std::string& user_id,
                                const std::string& key,
                                const std::string& error) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "rollup_failure";
    j["period"] = period;
    j["user"] = user_id;
    j["key"] = key;
    j["error"] = error;
    write_line(j.dump());
}

void Logger::log_backfill(const std::string& user_id, const DateRange& range,
                          int completed, int failed, int skipped) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "backfill";
    j["user"] = user_id;
    j["start"] = range.start.to_string();
    j["end"] = range.end.to_string();
    j["completed"] = completed;
    j["failed"] = failed;
    j["skipped"] = skipped;
    write_line(j.dump());
}

void Logger::log_insight(const Insight& insight) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "insight";
    j["rule"] = insight.key;
    j["severity"] = to_string(insight.severity);
    j["message"] = insight.message;
    write_line(j.dump());
}

void Logger::log_rule_error(const std::string& rule_key, const std::string& error) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "rule_error";
    j["rule"] = rule_key;
    j["error"] = error;
    write_line(j.dump());
}

void Logger::log_cache_invalidation(const std::string& user_id, std::size_t removed) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "cache_invalidation";
    j["user"] = user_id;
    j["removed"] = removed;
    write_line(j.dump());
}

void Logger::log_target_fallback(const std::string& user_id, const Date& date,
                                 const std::string& error) {
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "target_fallback";
    j["user"] = user_id;
    j["date"] = date.to_string();
    j["error"] = error;
    write_line(j.dump());
}

void Logger::write_line(const std::string& json) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << json << "\n";
        file_.flush();
    }
    if (echo_stdout_) {
        std::cout << json << std::endl;
    }
}

std::string Logger::timestamp_iso8601() const {
    return format_timestamp(std::chrono::system_clock::now());
}

} // namespace larder
