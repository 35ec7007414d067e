#include "server/request_telemetry.hpp"

namespace loadgate {

void RequestTelemetry::on_admitted() {
    ++total_;
    ++active_;
}

void RequestTelemetry::on_completed(double response_time_ms) {
    release_active();
    ++completed_;
    average_ms_ += (response_time_ms - average_ms_) / static_cast<double>(completed_);
}

void RequestTelemetry::on_failed() {
    release_active();
    ++failed_;
}

RequestTelemetry::Snapshot RequestTelemetry::snapshot() const {
    return {
        .total_requests = total_,
        .active_requests = active_,
        .completed_requests = completed_,
        .failed_requests = failed_,
        .average_response_time_ms = average_ms_,
    };
}

void RequestTelemetry::release_active() {
    if (active_ > 0) {
        --active_;
    }
}

} // namespace loadgate
