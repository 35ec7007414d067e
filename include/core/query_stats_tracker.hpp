#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace loadgate {

struct QueryStats {
    uint64_t count = 0;
    double total_time_ms = 0.0;
    double average_time_ms = 0.0;
    double min_time_ms = std::numeric_limits<double>::infinity();
    double max_time_ms = 0.0;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
};

/**
 * @brief Per-operation execution statistics
 *
 * Keyed by operation name. Cache hits are recorded by the executor under
 * "cached_<key>", executions under the operation text.
 */
class QueryStatsTracker {
public:
    void record(const std::string& name, double elapsed_ms, bool success);

    /// Snapshot ordered by operation name
    [[nodiscard]] std::map<std::string, QueryStats> snapshot() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, QueryStats> stats_;
};

} // namespace loadgate
