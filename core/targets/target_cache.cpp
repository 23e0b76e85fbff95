#include "targets/target_cache.h"

#include <stdexcept>

namespace larder {

TargetCache::TargetCache(std::chrono::seconds ttl, Clock clock, std::size_t shard_count)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("target cache ttl must be > 0");
    }
    if (shard_count == 0) {
        throw std::invalid_argument("target cache needs at least one shard");
    }
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::optional<TargetVector> TargetCache::get(const std::string& user_id, const Date& date) {
    auto& shard = shard_for(user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto user_it = shard.users.find(user_id);
    if (user_it == shard.users.end()) {
        return std::nullopt;
    }

    auto& entries = user_it->second.entries;
    auto it = entries.find(date);
    if (it == entries.end()) {
        return std::nullopt;
    }

    if (now() >= it->second.expires_at) {
        entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

std::uint64_t TargetCache::generation(const std::string& user_id) {
    auto& shard = shard_for(user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.users[user_id].generation;
}

bool TargetCache::put(const std::string& user_id, const Date& date,
                      const TargetVector& value, std::uint64_t generation) {
    auto& shard = shard_for(user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto at = now();
    sweep_expired(shard, at);

    auto& user = shard.users[user_id];
    if (user.generation != generation) {
        return false;
    }
    user.entries[date] = Entry{value, at + ttl_};
    return true;
}

std::size_t TargetCache::invalidate_user(const std::string& user_id) {
    auto& shard = shard_for(user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto& user = shard.users[user_id];
    std::size_t removed = user.entries.size();
    user.entries.clear();
    ++user.generation;
    return removed;
}

std::size_t TargetCache::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [user_id, user] : shard->users) {
            total += user.entries.size();
        }
    }
    return total;
}

void TargetCache::sweep_expired(Shard& shard, std::chrono::steady_clock::time_point at) {
    // User records stay behind with their generation.
    for (auto& [user_id, user] : shard.users) {
        for (auto it = user.entries.begin(); it != user.entries.end();) {
            if (at >= it->second.expires_at) {
                it = user.entries.erase(it);
            } else {
                ++it;
            }
        }
    }
}

TargetCache::Shard& TargetCache::shard_for(const std::string& user_id) {
    return *shards_[std::hash<std::string>{}(user_id) % shards_.size()];
}

std::chrono::steady_clock::time_point TargetCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

} // namespace larder
