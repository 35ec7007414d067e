#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace loadgate {

struct BurstSignal {
    size_t request_count;
    uint32_t threshold;
    std::chrono::system_clock::time_point detected_at;
};

/**
 * @brief Sliding-window burst detector over a bounded request history
 *
 * The history holds at most history_capacity entries (oldest evicted).
 * check() counts ADMITTED entries whose timestamp falls inside the trailing
 * window and reports a burst when the count reaches the threshold. Advisory only:
 * nothing here rejects or delays work.
 */
class BurstDetector {
public:
    struct Config {
        uint32_t threshold = 50;
        std::chrono::milliseconds window{60000};
        size_t history_capacity = 1000;
    };

    BurstDetector() : BurstDetector(Config{}) {}
    explicit BurstDetector(const Config& config);

    void record(HistoryEntry entry);

    /**
     * @brief Evaluate the trailing window
     * @return BurstSignal if the window holds >= threshold entries
     */
    [[nodiscard]] std::optional<BurstSignal> check();

    /**
     * @brief Get recent history entries (most recent last)
     * @param limit Max entries to return (0 = all)
     */
    [[nodiscard]] std::vector<HistoryEntry> recent(size_t limit = 0) const;

    [[nodiscard]] size_t history_size() const;

    [[nodiscard]] uint64_t detections() const {
        return detections_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_burst_time() const;

private:
    Config config_;
    mutable std::mutex mutex_;
    std::deque<HistoryEntry> history_;
    std::optional<std::chrono::system_clock::time_point> last_burst_;
    std::atomic<uint64_t> detections_{0};
};

} // namespace loadgate
