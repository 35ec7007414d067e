#include "cache/result_cache.hpp"

namespace loadgate {

ResultCache::ResultCache() : ResultCache(Config{}) {}

ResultCache::ResultCache(const Config& config)
    : config_(config) {}

std::optional<std::string> ResultCache::get(const std::string& key) {
    return get(key, config_.default_ttl);
}

std::optional<std::string> ResultCache::get(const std::string& key,
                                            std::chrono::milliseconds ttl) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto& entry = *it->second;

    // TTL check (lazy: stale entries stay until overwritten)
    if (std::chrono::steady_clock::now() - entry.inserted_at >= ttl) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    hits_.fetch_add(1, std::memory_order_relaxed);
    return entry.value;
}

void ResultCache::put(const std::string& key, std::string value) {
    std::lock_guard lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    // If key exists, update it
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->value = std::move(value);
        it->second->inserted_at = now;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (config_.max_entries > 0 && map_.size() >= config_.max_entries && !lru_list_.empty()) {
        auto& back = lru_list_.back();
        map_.erase(back.key);
        lru_list_.pop_back();
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(value), now});
    map_[key] = lru_list_.begin();
}

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    map_.clear();
    lru_list_.clear();
}

size_t ResultCache::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

std::vector<std::string> ResultCache::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(lru_list_.size());
    for (const auto& entry : lru_list_) {
        result.push_back(entry.key);
    }
    return result;
}

ResultCache::Stats ResultCache::get_stats() const {
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions_.load(std::memory_order_relaxed),
        .current_entries = size(),
    };
}

} // namespace loadgate
