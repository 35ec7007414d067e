#pragma once

#include "core/error.hpp"
#include "server/request_priority.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace loadgate {

// ============================================================================
// Request Payload
// ============================================================================

/**
 * @brief Work description handed to the injected execution callback
 *
 * `cacheable` marks a data operation whose result may be served from the
 * result cache. The cache key is taken from `cache_key` when set, otherwise
 * derived from `operation` and `params`.
 */
struct RequestPayload {
    std::string operation;                          // Query text or route
    std::vector<std::string> params;
    bool cacheable = false;
    std::optional<std::string> cache_key;
    std::optional<std::chrono::milliseconds> cache_ttl;  // Overrides default TTL

    RequestPayload() = default;
    explicit RequestPayload(std::string op) : operation(std::move(op)) {}
    RequestPayload(std::string op, std::vector<std::string> p, bool is_cacheable)
        : operation(std::move(op)), params(std::move(p)), cacheable(is_cacheable) {}
};

/**
 * @brief Injected persistence collaborator
 *
 * Returns the operation result as an opaque string, or an error Result.
 * Throwing is tolerated and treated as EXECUTION_FAILED.
 */
using ExecuteFn = std::function<Result<std::string>(const RequestPayload&)>;

// ============================================================================
// Execution Outcome
// ============================================================================

struct ExecutionOutcome {
    std::string data;
    bool from_cache = false;
    std::string cache_key;        // Empty for non-cacheable payloads
};

// ============================================================================
// Admission Ticket
// ============================================================================

struct AdmissionTicket {
    std::string id;
    RequestPayload payload;
    PriorityLevel priority = PriorityLevel::NORMAL;
    std::chrono::system_clock::time_point enqueued_at;
    std::chrono::steady_clock::time_point enqueued_steady;
    std::optional<std::chrono::system_clock::time_point> dispatched_at;
};

// ============================================================================
// Request History
// ============================================================================

enum class HistoryKind {
    ADMITTED,
    COMPLETED,
    FAILED
};

struct HistoryEntry {
    std::string id;
    std::chrono::system_clock::time_point timestamp;   // Enqueue time of the ticket
    double response_time_ms = 0.0;
    HistoryKind kind = HistoryKind::ADMITTED;
    bool success = true;
    std::string error;
};

} // namespace loadgate
