#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace loadgate {

/**
 * @brief Key → (value, insertion time) cache with lazy TTL expiration
 *
 * TTL is supplied by the reader, so the same entry can be fresh for one
 * ticket and stale for another. An entry is fresh iff
 * now - inserted_at < ttl. Stale entries are never swept; they stay until
 * the next miss overwrites them or clear() runs.
 *
 * max_entries = 0 leaves the cache unbounded. A positive bound evicts the
 * least recently used entry on insert.
 */
class ResultCache {
public:
    struct Config {
        size_t max_entries = 0;
        std::chrono::milliseconds default_ttl{300000};
    };

    ResultCache();
    explicit ResultCache(const Config& config);

    /// Lookup with the default TTL. Returns nullopt on miss or expiry.
    [[nodiscard]] std::optional<std::string> get(const std::string& key);

    /// Lookup with an explicit TTL. Returns nullopt on miss or expiry.
    [[nodiscard]] std::optional<std::string> get(const std::string& key,
                                                 std::chrono::milliseconds ttl);

    /// Insert or overwrite, stamping the current time.
    void put(const std::string& key, std::string value);

    void clear();

    [[nodiscard]] size_t size() const;

    /// Cached keys, most recently used first (stale entries included)
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::chrono::milliseconds default_ttl() const { return config_.default_ttl; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        std::string value;
        std::chrono::steady_clock::time_point inserted_at;
    };

    Config config_;
    mutable std::mutex mutex_;
    std::list<CacheEntry> lru_list_;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace loadgate
