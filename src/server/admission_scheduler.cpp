#include "server/admission_scheduler.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace loadgate {

// ============================================================================
// Enum helpers
// ============================================================================

std::optional<DispatchMode> parse_dispatch_mode(std::string_view str) {
    const auto lower = utils::to_lower(str);
    if (lower == "concurrent") return DispatchMode::CONCURRENT;
    if (lower == "serialized") return DispatchMode::SERIALIZED;
    return std::nullopt;
}

const char* dispatch_mode_to_string(DispatchMode mode) {
    return mode == DispatchMode::SERIALIZED ? "serialized" : "concurrent";
}

const char* event_type_to_string(SchedulerEventType type) {
    switch (type) {
        case SchedulerEventType::REQUEST_ADDED:           return "requestAdded";
        case SchedulerEventType::REQUEST_COMPLETED:       return "requestCompleted";
        case SchedulerEventType::REQUEST_FAILED:          return "requestFailed";
        case SchedulerEventType::BURST_DETECTED:          return "burstDetected";
        case SchedulerEventType::CIRCUIT_BREAKER_TRIPPED: return "circuitBreakerTripped";
        case SchedulerEventType::CIRCUIT_BREAKER_RESET:   return "circuitBreakerReset";
        case SchedulerEventType::ENABLED:                 return "enabled";
        case SchedulerEventType::DISABLED:                return "disabled";
        default:                                          return "unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

AdmissionScheduler::AdmissionScheduler(const Config& config, ExecuteFn execute_fn)
    : config_(config),
      cache_(std::make_shared<ResultCache>(config.cache)),
      query_stats_(std::make_shared<QueryStatsTracker>()),
      executor_(CachedExecutor::create(std::move(execute_fn), cache_, query_stats_)),
      breaker_("dispatch", config.circuit_breaker),
      burst_(config.burst) {
    if (config_.max_concurrent_requests == 0) {
        config_.max_concurrent_requests = 1;
    }
    breaker_.set_on_state_change([this](const StateChangeEvent& change) {
        on_breaker_transition(change);
    });
}

AdmissionScheduler::~AdmissionScheduler() {
    halt();

    // Detached execution units reference this scheduler until they record
    // their outcome; each is bounded by request_timeout.
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return inflight_ == 0; });
}

// ============================================================================
// Admission
// ============================================================================

std::string AdmissionScheduler::enqueue(RequestPayload payload, std::string_view priority) {
    if (!is_known_priority(priority)) {
        utils::log::warn(std::format("Unknown priority '{}', admitting as normal", priority));
    }
    return enqueue(std::move(payload), parse_priority(priority));
}

std::string AdmissionScheduler::enqueue(RequestPayload payload, PriorityLevel priority) {
    AdmissionTicket ticket;
    ticket.id = utils::generate_request_id();
    ticket.payload = std::move(payload);
    ticket.priority = priority;
    ticket.enqueued_at = std::chrono::system_clock::now();
    ticket.enqueued_steady = std::chrono::steady_clock::now();

    const std::string id = ticket.id;
    const auto enqueued_at = ticket.enqueued_at;

    {
        std::lock_guard lock(mutex_);
        lanes_.push(std::move(ticket));
        telemetry_.on_admitted();
    }
    cv_.notify_all();

    burst_.record(HistoryEntry{
        .id = id,
        .timestamp = enqueued_at,
        .response_time_ms = 0.0,
        .kind = HistoryKind::ADMITTED,
        .success = true,
        .error = {},
    });

    if (const auto burst = burst_.check()) {
        utils::log::warn(std::format("Burst detected: {} requests in the last {}ms (threshold {})",
                                     burst->request_count, config_.burst.window.count(),
                                     burst->threshold));
        emit(SchedulerEvent{
            .type = SchedulerEventType::BURST_DETECTED,
            .timestamp = burst->detected_at,
            .request_count = burst->request_count,
            .threshold = burst->threshold,
        });
    }

    emit(SchedulerEvent{
        .type = SchedulerEventType::REQUEST_ADDED,
        .timestamp = enqueued_at,
        .ticket_id = id,
        .priority = priority,
    });

    return id;
}

// ============================================================================
// Subscribers
// ============================================================================

size_t AdmissionScheduler::subscribe(EventListener listener) {
    std::lock_guard lock(listeners_mutex_);
    const size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void AdmissionScheduler::unsubscribe(size_t subscription_id) {
    std::lock_guard lock(listeners_mutex_);
    std::erase_if(listeners_, [subscription_id](const auto& entry) {
        return entry.first == subscription_id;
    });
}

void AdmissionScheduler::emit(const SchedulerEvent& event) {
    std::vector<EventListener> targets;
    {
        std::lock_guard lock(listeners_mutex_);
        targets.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            targets.push_back(listener);
        }
    }

    for (const auto& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Subscriber failed on {} event: {}",
                                          event_type_to_string(event.type), e.what()));
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void AdmissionScheduler::enable() {
    {
        std::lock_guard control(control_mutex_);
        if (enabled_.load(std::memory_order_acquire)) return;
        enabled_.store(true, std::memory_order_release);
        dispatcher_ = std::jthread([this](std::stop_token stop) {
            dispatch_loop(std::move(stop));
        });
    }
    utils::log::info(std::format("Admission scheduler enabled ({} dispatch, max {} in flight)",
                                 dispatch_mode_to_string(config_.dispatch_mode),
                                 config_.max_concurrent_requests));
    emit(SchedulerEvent{.type = SchedulerEventType::ENABLED});
}

void AdmissionScheduler::disable() {
    if (!halt()) return;
    utils::log::info("Admission scheduler disabled");
    emit(SchedulerEvent{.type = SchedulerEventType::DISABLED});
}

void AdmissionScheduler::set_enabled(bool enabled) {
    if (enabled) {
        enable();
    } else {
        disable();
    }
}

void AdmissionScheduler::stop() {
    if (halt()) {
        utils::log::info("Admission scheduler stopped");
    }
}

bool AdmissionScheduler::halt() {
    std::lock_guard control(control_mutex_);
    if (!enabled_.load(std::memory_order_acquire)) return false;
    enabled_.store(false, std::memory_order_release);
    if (dispatcher_.joinable()) {
        dispatcher_.request_stop();
        cv_.notify_all();
        dispatcher_.join();
    }
    return true;
}

// ============================================================================
// Dispatch
// ============================================================================

void AdmissionScheduler::dispatch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // allow_request() closes the breaker once the cooldown has elapsed
        if (!breaker_.allow_request()) {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, stop, config_.open_backoff, [] { return false; });
            continue;
        }

        std::unique_lock lock(mutex_);
        if (inflight_ >= config_.max_concurrent_requests) {
            cv_.wait_for(lock, stop, config_.idle_backoff, [this] {
                return inflight_ < config_.max_concurrent_requests;
            });
            continue;
        }

        auto ticket = lanes_.pop_next();
        if (!ticket) {
            cv_.wait_for(lock, stop, config_.idle_backoff, [this] { return !lanes_.empty(); });
            continue;
        }

        ticket->dispatched_at = std::chrono::system_clock::now();
        ++inflight_;
        peak_inflight_ = std::max(peak_inflight_, inflight_);
        lock.unlock();

        if (config_.dispatch_mode == DispatchMode::SERIALIZED) {
            run_ticket(std::move(*ticket));
        } else {
            launch(std::move(*ticket));
        }
    }
}

void AdmissionScheduler::launch(AdmissionTicket ticket) {
    // The ticket is moved into the thread only once construction succeeds;
    // a copy is kept so it can run inline if no thread can be created.
    try {
        std::thread([this, t = ticket]() mutable {
            run_ticket(std::move(t));
        }).detach();
    } catch (const std::system_error& e) {
        utils::log::warn(std::format("Cannot start execution unit for {} ({}), running inline",
                                     ticket.id, e.what()));
        run_ticket(std::move(ticket));
    }
}

void AdmissionScheduler::run_ticket(AdmissionTicket ticket) {
    const auto result = executor_->execute_with_timeout(ticket.payload, config_.request_timeout);
    const double response_ms = utils::elapsed_ms(ticket.enqueued_steady,
                                                 std::chrono::steady_clock::now());

    SchedulerEvent event{
        .type = result.is_ok() ? SchedulerEventType::REQUEST_COMPLETED
                               : SchedulerEventType::REQUEST_FAILED,
        .ticket_id = ticket.id,
        .priority = ticket.priority,
    };

    {
        std::lock_guard lock(mutex_);
        if (result.is_ok()) {
            telemetry_.on_completed(response_ms);
        } else {
            telemetry_.on_failed();
        }
    }

    if (result.is_ok()) {
        burst_.record(HistoryEntry{
            .id = ticket.id,
            .timestamp = ticket.enqueued_at,
            .response_time_ms = response_ms,
            .kind = HistoryKind::COMPLETED,
            .success = true,
            .error = {},
        });
        breaker_.record_success();

        event.result = result.value().data;
        event.from_cache = result.value().from_cache;
    } else {
        burst_.record(HistoryEntry{
            .id = ticket.id,
            .timestamp = ticket.enqueued_at,
            .response_time_ms = response_ms,
            .kind = HistoryKind::FAILED,
            .success = false,
            .error = result.error_message(),
        });
        utils::log::warn(std::format("Request {} failed ({}): {}", ticket.id,
                                     error_category_to_string(result.error_category()),
                                     result.error_message()));
        breaker_.record_failure();

        event.error = result.error_category();
        event.error_message = result.error_message();
    }

    emit(event);

    // Last touch of the scheduler: the destructor waits for inflight_ == 0
    std::lock_guard lock(mutex_);
    --inflight_;
    cv_.notify_all();
}

void AdmissionScheduler::on_breaker_transition(const StateChangeEvent& change) {
    if (change.to == CircuitState::OPEN) {
        utils::log::error(std::format("Circuit breaker tripped after {} failures; dispatch halted",
                                      change.failure_count));
        emit(SchedulerEvent{
            .type = SchedulerEventType::CIRCUIT_BREAKER_TRIPPED,
            .timestamp = change.timestamp,
            .failure_count = change.failure_count,
            .threshold = config_.circuit_breaker.failure_threshold,
        });
    } else {
        utils::log::info("Circuit breaker reset; dispatch resumed");
        emit(SchedulerEvent{
            .type = SchedulerEventType::CIRCUIT_BREAKER_RESET,
            .timestamp = change.timestamp,
        });
    }
}

// ============================================================================
// Observability
// ============================================================================

SchedulerSnapshot AdmissionScheduler::get_stats() const {
    SchedulerSnapshot snap;
    snap.enabled = is_enabled();
    snap.dispatch_mode = config_.dispatch_mode;

    {
        std::lock_guard lock(mutex_);
        const auto t = telemetry_.snapshot();
        snap.total_requests = t.total_requests;
        snap.active_requests = t.active_requests;
        snap.completed_requests = t.completed_requests;
        snap.failed_requests = t.failed_requests;
        snap.average_response_time_ms = t.average_response_time_ms;
        snap.inflight_requests = inflight_;
        snap.queue_sizes = lanes_.sizes();
        snap.total_queue_size = lanes_.total_size();
    }

    snap.circuit_breaker = breaker_.get_stats();
    snap.circuit_breaker_trips = snap.circuit_breaker.trips;
    snap.burst_detections = burst_.detections();
    snap.last_burst_time = burst_.last_burst_time();
    snap.cache_keys = cache_->keys();
    snap.cache_size = snap.cache_keys.size();
    snap.query_stats = query_stats_->snapshot();
    return snap;
}

std::map<std::string, QueryStats> AdmissionScheduler::get_query_stats() const {
    return query_stats_->snapshot();
}

ResultCache::Stats AdmissionScheduler::get_cache_stats() const {
    return cache_->get_stats();
}

std::vector<HistoryEntry> AdmissionScheduler::recent_history(size_t limit) const {
    return burst_.recent(limit);
}

void AdmissionScheduler::clear_cache() {
    cache_->clear();
    utils::log::info("Result cache cleared");
}

bool AdmissionScheduler::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return lanes_.empty() && inflight_ == 0;
    });
}

uint32_t AdmissionScheduler::peak_inflight() const {
    std::lock_guard lock(mutex_);
    return peak_inflight_;
}

} // namespace loadgate
