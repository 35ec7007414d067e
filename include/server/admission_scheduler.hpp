#pragma once

#include "cache/result_cache.hpp"
#include "core/query_stats_tracker.hpp"
#include "core/types.hpp"
#include "executor/cached_executor.hpp"
#include "executor/circuit_breaker.hpp"
#include "server/burst_detector.hpp"
#include "server/priority_lanes.hpp"
#include "server/request_priority.hpp"
#include "server/request_telemetry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace loadgate {

/**
 * @brief How dispatched tickets are executed
 *
 * CONCURRENT: each ticket runs on its own execution unit, up to
 *             max_concurrent_requests at once.
 * SERIALIZED: the dispatcher runs each ticket to completion (or timeout)
 *             before selecting the next, so one ticket is in flight at most.
 */
enum class DispatchMode {
    CONCURRENT,
    SERIALIZED
};

std::optional<DispatchMode> parse_dispatch_mode(std::string_view str);
const char* dispatch_mode_to_string(DispatchMode mode);

enum class SchedulerEventType {
    REQUEST_ADDED,
    REQUEST_COMPLETED,
    REQUEST_FAILED,
    BURST_DETECTED,
    CIRCUIT_BREAKER_TRIPPED,
    CIRCUIT_BREAKER_RESET,
    ENABLED,
    DISABLED
};

const char* event_type_to_string(SchedulerEventType type);

struct SchedulerEvent {
    SchedulerEventType type;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    // Ticket events
    std::string ticket_id;
    PriorityLevel priority = PriorityLevel::NORMAL;
    std::string result;                     // REQUEST_COMPLETED
    bool from_cache = false;                // REQUEST_COMPLETED
    ErrorCategory error = ErrorCategory::NONE;  // REQUEST_FAILED
    std::string error_message;              // REQUEST_FAILED

    // Burst / breaker events
    size_t request_count = 0;               // BURST_DETECTED
    uint64_t failure_count = 0;             // CIRCUIT_BREAKER_TRIPPED
    uint32_t threshold = 0;                 // BURST_DETECTED, CIRCUIT_BREAKER_TRIPPED
};

using EventListener = std::function<void(const SchedulerEvent&)>;

/**
 * @brief Point-in-time view of the scheduler for monitoring
 */
struct SchedulerSnapshot {
    bool enabled = false;
    DispatchMode dispatch_mode = DispatchMode::CONCURRENT;

    uint64_t total_requests = 0;
    uint64_t active_requests = 0;           // Admitted, outcome not yet recorded
    uint64_t inflight_requests = 0;         // Dispatched, outcome not yet recorded
    uint64_t completed_requests = 0;
    uint64_t failed_requests = 0;
    double average_response_time_ms = 0.0;
    uint64_t circuit_breaker_trips = 0;
    uint64_t burst_detections = 0;
    std::optional<std::chrono::system_clock::time_point> last_burst_time;

    CircuitBreakerStats circuit_breaker;

    PriorityLanes::LaneSizes queue_sizes{};
    size_t total_queue_size = 0;

    size_t cache_size = 0;
    std::vector<std::string> cache_keys;

    std::map<std::string, QueryStats> query_stats;
};

/**
 * @brief In-process admission control and priority dispatch
 *
 * enqueue() places a ticket in its priority lane and returns its id at once.
 * A background dispatcher (started by enable()) repeatedly:
 *   1. backs off while the circuit breaker is cooling down,
 *   2. backs off while max_concurrent_requests tickets are in flight,
 *   3. pops the head of the highest non-empty lane (or backs off if none),
 *   4. resolves it through the CachedExecutor, racing request_timeout,
 *   5. records the outcome (telemetry, history, breaker) and notifies
 *      subscribers.
 *
 * Open breakers and a full concurrency budget only delay dispatch; they are
 * never reported as ticket errors. Tickets cannot be cancelled.
 *
 * Thread-safety: lanes, telemetry and the in-flight count are guarded by one
 * mutex. Subscribers are called with no scheduler lock held, on the thread
 * that produced the event (caller thread for admission events, dispatcher or
 * execution unit for outcome events).
 */
class AdmissionScheduler {
public:
    struct Config {
        uint32_t max_concurrent_requests = 150;
        std::chrono::milliseconds request_timeout{10000};
        DispatchMode dispatch_mode = DispatchMode::CONCURRENT;
        std::chrono::milliseconds open_backoff{1000};
        std::chrono::milliseconds idle_backoff{100};
        CircuitBreaker::Config circuit_breaker;
        BurstDetector::Config burst;
        ResultCache::Config cache;
    };

    AdmissionScheduler(const Config& config, ExecuteFn execute_fn);
    ~AdmissionScheduler();

    AdmissionScheduler(const AdmissionScheduler&) = delete;
    AdmissionScheduler& operator=(const AdmissionScheduler&) = delete;

    /**
     * @brief Admit a ticket. Never blocks on dispatch, never throws on load.
     * @param priority "critical", "high", "normal" or "low"; anything else
     *        is admitted as "normal"
     * @return ticket id
     */
    std::string enqueue(RequestPayload payload, std::string_view priority);

    std::string enqueue(RequestPayload payload, PriorityLevel priority = PriorityLevel::NORMAL);

    /// @return subscription id for unsubscribe()
    size_t subscribe(EventListener listener);
    void unsubscribe(size_t subscription_id);

    /// Start the dispatcher. No-op if already running.
    void enable();

    /// Halt the dispatcher; queued tickets stay queued.
    void disable();

    void set_enabled(bool enabled);

    /// Halt the dispatcher without notifying subscribers.
    void stop();

    [[nodiscard]] bool is_enabled() const { return enabled_.load(std::memory_order_acquire); }

    [[nodiscard]] SchedulerSnapshot get_stats() const;
    [[nodiscard]] std::map<std::string, QueryStats> get_query_stats() const;
    [[nodiscard]] ResultCache::Stats get_cache_stats() const;
    [[nodiscard]] std::vector<HistoryEntry> recent_history(size_t limit = 0) const;

    void clear_cache();

    /**
     * @brief Block until every lane is empty and nothing is in flight
     * @return false if `timeout` elapsed first
     */
    [[nodiscard]] bool wait_until_idle(std::chrono::milliseconds timeout);

    /// Highest number of simultaneously in-flight tickets observed
    [[nodiscard]] uint32_t peak_inflight() const;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const CircuitBreaker& circuit_breaker() const { return breaker_; }

private:
    void dispatch_loop(std::stop_token stop);
    void launch(AdmissionTicket ticket);
    void run_ticket(AdmissionTicket ticket);
    void on_breaker_transition(const StateChangeEvent& change);
    bool halt();

    void emit(const SchedulerEvent& event);

    Config config_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<QueryStatsTracker> query_stats_;
    std::shared_ptr<CachedExecutor> executor_;
    CircuitBreaker breaker_;
    BurstDetector burst_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    PriorityLanes lanes_;
    RequestTelemetry telemetry_;
    uint32_t inflight_ = 0;
    uint32_t peak_inflight_ = 0;

    mutable std::mutex listeners_mutex_;
    std::vector<std::pair<size_t, EventListener>> listeners_;
    size_t next_listener_id_ = 1;

    std::mutex control_mutex_;
    std::atomic<bool> enabled_{false};
    std::jthread dispatcher_;
};

} // namespace loadgate
