#include "server/stats_reporter.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace loadgate {

namespace {

std::string optional_timestamp(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return "null";
    return std::format("\"{}\"", utils::format_timestamp(*tp));
}

void append_query_stats(std::string& json, const std::map<std::string, QueryStats>& stats) {
    json += "\"query_stats\":{";
    bool first = true;
    for (const auto& [name, s] : stats) {
        if (!first) json += ",";
        first = false;
        // min starts at +inf until the first sample
        const double min_ms = std::isfinite(s.min_time_ms) ? s.min_time_ms : 0.0;
        json += std::format(
            "\"{}\":{{\"count\":{},\"total_time_ms\":{:.2f},\"average_time_ms\":{:.2f},"
            "\"min_time_ms\":{:.2f},\"max_time_ms\":{:.2f},"
            "\"success_count\":{},\"failure_count\":{}}}",
            utils::escape_json(name), s.count, s.total_time_ms, s.average_time_ms,
            min_ms, s.max_time_ms, s.success_count, s.failure_count);
    }
    json += "}";
}

} // anonymous namespace

std::string stats_to_json(const SchedulerSnapshot& snap) {
    std::string json = "{";
    json.reserve(1024);

    json += std::format(
        "\"enabled\":{},\"dispatch_mode\":\"{}\",\"total_requests\":{},\"active_requests\":{},"
        "\"inflight_requests\":{},\"completed_requests\":{},\"failed_requests\":{},"
        "\"average_response_time_ms\":{:.2f},\"circuit_breaker_trips\":{},"
        "\"burst_detections\":{},\"last_burst_time\":{},",
        utils::booltostr(snap.enabled), dispatch_mode_to_string(snap.dispatch_mode),
        snap.total_requests, snap.active_requests, snap.inflight_requests,
        snap.completed_requests, snap.failed_requests, snap.average_response_time_ms,
        snap.circuit_breaker_trips, snap.burst_detections,
        optional_timestamp(snap.last_burst_time));

    const auto& cb = snap.circuit_breaker;
    json += std::format(
        "\"circuit_breaker\":{{\"state\":\"{}\",\"is_open\":{},\"failure_count\":{},"
        "\"success_count\":{},\"trips\":{},\"last_failure\":{}}},",
        circuit_state_to_string(cb.state), utils::booltostr(cb.is_open),
        cb.failure_count, cb.success_count, cb.trips, optional_timestamp(cb.last_failure));

    json += "\"queue_sizes\":{";
    for (size_t i = 0; i < kDispatchOrder.size(); ++i) {
        if (i > 0) json += ",";
        const auto level = kDispatchOrder[i];
        json += std::format("\"{}\":{}", priority_to_string(level),
                            snap.queue_sizes[priority_index(level)]);
    }
    json += std::format("}},\"total_queue_size\":{},", snap.total_queue_size);

    json += std::format("\"cache\":{{\"size\":{},\"keys\":[", snap.cache_size);
    for (size_t i = 0; i < snap.cache_keys.size(); ++i) {
        if (i > 0) json += ",";
        json += std::format("\"{}\"", utils::escape_json(snap.cache_keys[i]));
    }
    json += "]},";

    append_query_stats(json, snap.query_stats);

    json += std::format(",\"timestamp\":\"{}\"}}",
        utils::format_timestamp(std::chrono::system_clock::now()));
    return json;
}

} // namespace loadgate
