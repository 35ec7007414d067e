#pragma once

#include <cstdint>

namespace loadgate {

/**
 * @brief Request counters and incremental mean response time
 *
 * Not thread-safe. The scheduler updates it under its own lock.
 */
class RequestTelemetry {
public:
    struct Snapshot {
        uint64_t total_requests;
        uint64_t active_requests;
        uint64_t completed_requests;
        uint64_t failed_requests;
        double average_response_time_ms;
    };

    void on_admitted();

    /// avg += (elapsed - avg) / completed
    void on_completed(double response_time_ms);

    void on_failed();

    [[nodiscard]] Snapshot snapshot() const;

private:
    void release_active();

    uint64_t total_ = 0;
    uint64_t active_ = 0;
    uint64_t completed_ = 0;
    uint64_t failed_ = 0;
    double average_ms_ = 0.0;
};

} // namespace loadgate
