#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loadgate {

enum class CircuitState {
    CLOSED,
    OPEN
};

inline const char* circuit_state_to_string(CircuitState state) {
    return state == CircuitState::OPEN ? "open" : "closed";
}

/**
 * @brief Circuit Breaker gating dispatch to the downstream resource
 *
 * Two states:
 * - CLOSED: dispatch proceeds
 * - OPEN:   dispatch is halted; queued work stays queued
 *
 * State transitions:
 * - CLOSED → OPEN:   failure_count >= failure_threshold
 * - OPEN → CLOSED:   now - last_failure > timeout (checked by allow_request)
 *
 * There is no HALF_OPEN state. Cooldown expiry closes the breaker outright
 * and the next outcome is the first trial. While CLOSED, every success_threshold
 * successes clear the failure count (fast healing). Outcomes reported while
 * OPEN are ignored, so late failures do not extend the cooldown.
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
    uint64_t failure_count;
};

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    bool is_open = false;
    uint64_t failure_count = 0;
    uint64_t success_count = 0;
    uint64_t trips = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::optional<std::chrono::system_clock::time_point> opened_at;
};

class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold;         // Failures to trip OPEN
        uint32_t success_threshold;         // Successes that clear failures while CLOSED
        std::chrono::milliseconds timeout;  // Cooldown measured from the last failure

        Config()
            : failure_threshold(10),
              success_threshold(5),
              timeout(30000) {}
    };

    explicit CircuitBreaker(std::string name, const Config& config = Config());

    /**
     * @brief Check if dispatch may proceed
     *
     * Closes an OPEN breaker whose cooldown has elapsed.
     * @return true if CLOSED (possibly just now), false while cooling down
     */
    bool allow_request();

    void record_success();

    void record_failure();

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] bool is_open() const { return get_state() == CircuitState::OPEN; }

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED state (clears counters and events)
     */
    void reset();

    const std::string& name() const { return name_; }
    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions
     *
     * Invoked after the breaker's lock is released, on the thread that
     * caused the transition.
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    StateChangeEvent trip_locked();
    StateChangeEvent close_locked();
    void publish(const StateChangeEvent& event);

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};

    mutable std::mutex mutex_;
    uint64_t failure_count_ = 0;
    uint64_t success_count_ = 0;
    uint64_t trips_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_failure_steady_;
    std::optional<std::chrono::system_clock::time_point> last_failure_time_;
    std::optional<std::chrono::system_clock::time_point> opened_time_;

    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace loadgate
