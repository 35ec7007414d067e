#include "executor/circuit_breaker.hpp"

namespace loadgate {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {}

bool CircuitBreaker::allow_request() {
    if (state_.load(std::memory_order_acquire) == CircuitState::CLOSED) {
        return true;
    }

    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        if (state_.load(std::memory_order_relaxed) == CircuitState::CLOSED) {
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        const auto since_failure = last_failure_steady_
            ? now - *last_failure_steady_
            : std::chrono::steady_clock::duration::max();

        if (since_failure <= config_.timeout) {
            // Still cooling down
            return false;
        }
        event = close_locked();
    }

    publish(*event);
    return true;
}

void CircuitBreaker::record_success() {
    std::lock_guard lock(mutex_);
    if (state_.load(std::memory_order_relaxed) != CircuitState::CLOSED) {
        return;
    }

    ++success_count_;
    if (success_count_ >= config_.success_threshold) {
        failure_count_ = 0;
        success_count_ = 0;
    }
}

void CircuitBreaker::record_failure() {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        if (state_.load(std::memory_order_relaxed) == CircuitState::OPEN) {
            return;
        }

        ++failure_count_;
        last_failure_steady_ = std::chrono::steady_clock::now();
        last_failure_time_ = std::chrono::system_clock::now();

        if (failure_count_ >= config_.failure_threshold) {
            event = trip_locked();
        }
    }

    if (event) {
        publish(*event);
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::lock_guard lock(mutex_);
    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_relaxed);
    stats.is_open = stats.state == CircuitState::OPEN;
    stats.failure_count = failure_count_;
    stats.success_count = success_count_;
    stats.trips = trips_;
    stats.last_failure = last_failure_time_;
    stats.opened_at = opened_time_;
    return stats;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_.store(CircuitState::CLOSED, std::memory_order_release);
    failure_count_ = 0;
    success_count_ = 0;
    last_failure_steady_.reset();
    last_failure_time_.reset();
    opened_time_.reset();
    recent_events_.clear();
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

StateChangeEvent CircuitBreaker::trip_locked() {
    const auto now = std::chrono::system_clock::now();
    state_.store(CircuitState::OPEN, std::memory_order_release);
    opened_time_ = now;
    ++trips_;

    StateChangeEvent event{CircuitState::CLOSED, CircuitState::OPEN, now, name_, failure_count_};
    recent_events_.push_back(event);
    while (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }
    return event;
}

StateChangeEvent CircuitBreaker::close_locked() {
    StateChangeEvent event{CircuitState::OPEN, CircuitState::CLOSED,
                           std::chrono::system_clock::now(), name_, failure_count_};
    state_.store(CircuitState::CLOSED, std::memory_order_release);
    failure_count_ = 0;
    success_count_ = 0;

    recent_events_.push_back(event);
    while (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }
    return event;
}

void CircuitBreaker::publish(const StateChangeEvent& event) {
    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_state_change_;
    }
    if (cb) {
        cb(event);
    }
}

} // namespace loadgate
