#pragma once

#include "calendar/date.h"
#include "targets/target_vector.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace larder {

// Resolved targets keyed by (user, date) with a fixed time-to-live. Users are
// spread over independently locked shards. Each user carries a generation
// counter bumped by invalidate_user(), so a value computed from layers read
// before an invalidation is never stored after it.
class TargetCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit TargetCache(std::chrono::seconds ttl, Clock clock = nullptr,
                         std::size_t shard_count = 16);

    TargetCache(const TargetCache&) = delete;
    TargetCache& operator=(const TargetCache&) = delete;

    // Unexpired entry, if any. Expired entries are dropped on access.
    std::optional<TargetVector> get(const std::string& user_id, const Date& date);

    // Generation to pass to put() for a value about to be computed.
    std::uint64_t generation(const std::string& user_id);

    // Stores the value unless the user was invalidated since `generation`
    // was read. Returns whether it was stored. Expired entries in the same
    // shard are dropped first.
    bool put(const std::string& user_id, const Date& date, const TargetVector& value,
             std::uint64_t generation);

    // Drops every entry for the user; returns how many were removed.
    std::size_t invalidate_user(const std::string& user_id);

    std::size_t size() const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        TargetVector value;
        std::chrono::steady_clock::time_point expires_at;
    };

    struct UserEntries {
        std::uint64_t generation = 0;
        std::map<Date, Entry> entries;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, UserEntries> users;
    };

    static void sweep_expired(Shard& shard, std::chrono::steady_clock::time_point at);
    Shard& shard_for(const std::string& user_id);
    std::chrono::steady_clock::time_point now() const;

    std::chrono::seconds ttl_;
    Clock clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace larder
