#include "server/burst_detector.hpp"

#include <algorithm>

namespace loadgate {

BurstDetector::BurstDetector(const Config& config)
    : config_(config) {}

void BurstDetector::record(HistoryEntry entry) {
    std::lock_guard lock(mutex_);
    history_.push_back(std::move(entry));
    while (history_.size() > config_.history_capacity) {
        history_.pop_front();
    }
}

std::optional<BurstSignal> BurstDetector::check() {
    const auto now = std::chrono::system_clock::now();

    std::lock_guard lock(mutex_);
    const auto in_window = static_cast<size_t>(std::count_if(
        history_.begin(), history_.end(), [&](const HistoryEntry& e) {
            // Outcome entries share their ticket's timestamp; only admissions count
            return e.kind == HistoryKind::ADMITTED && now - e.timestamp < config_.window;
        }));

    if (in_window < config_.threshold) {
        return std::nullopt;
    }

    detections_.fetch_add(1, std::memory_order_relaxed);
    last_burst_ = now;
    return BurstSignal{in_window, config_.threshold, now};
}

std::vector<HistoryEntry> BurstDetector::recent(size_t limit) const {
    std::lock_guard lock(mutex_);

    if (limit == 0 || limit >= history_.size()) {
        return {history_.begin(), history_.end()};
    }

    const auto start = history_.end() - static_cast<std::ptrdiff_t>(limit);
    return {start, history_.end()};
}

size_t BurstDetector::history_size() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

std::optional<std::chrono::system_clock::time_point> BurstDetector::last_burst_time() const {
    std::lock_guard lock(mutex_);
    return last_burst_;
}

} // namespace loadgate
