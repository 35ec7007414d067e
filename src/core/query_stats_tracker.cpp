#include "core/query_stats_tracker.hpp"

#include <algorithm>

namespace loadgate {

void QueryStatsTracker::record(const std::string& name, double elapsed_ms, bool success) {
    std::lock_guard lock(mutex_);
    auto& stats = stats_[name];

    ++stats.count;
    stats.total_time_ms += elapsed_ms;
    stats.average_time_ms = stats.total_time_ms / static_cast<double>(stats.count);
    stats.min_time_ms = std::min(stats.min_time_ms, elapsed_ms);
    stats.max_time_ms = std::max(stats.max_time_ms, elapsed_ms);

    if (success) {
        ++stats.success_count;
    } else {
        ++stats.failure_count;
    }
}

std::map<std::string, QueryStats> QueryStatsTracker::snapshot() const {
    std::lock_guard lock(mutex_);
    return {stats_.begin(), stats_.end()};
}

size_t QueryStatsTracker::size() const {
    std::lock_guard lock(mutex_);
    return stats_.size();
}

} // namespace loadgate
