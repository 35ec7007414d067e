#pragma once

#include "cache/result_cache.hpp"
#include "core/error.hpp"
#include "core/query_stats_tracker.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace loadgate {

/**
 * @brief Cache-aware executor wrapping the injected persistence callback
 *
 * Cacheable payloads are looked up in the ResultCache first; a fresh hit is
 * returned with from_cache=true and the callback is not invoked. On a miss
 * the callback runs and its result is stored under the cache key with the
 * current timestamp. Non-cacheable payloads always invoke the callback.
 *
 * execute_with_timeout() runs the resolution on a detached worker thread and
 * waits at most `timeout`. A timed-out execution is reported as
 * TIMEOUT_EXCEEDED and whatever the callback produces afterwards is
 * discarded: it is neither cached nor counted as a success. A callback that
 * never returns keeps its worker thread for the life of the process.
 *
 * Workers hold a shared_ptr to the executor, so instances must be owned by a
 * shared_ptr (see create()).
 */
class CachedExecutor : public std::enable_shared_from_this<CachedExecutor> {
public:
    static std::shared_ptr<CachedExecutor> create(
        ExecuteFn execute_fn,
        std::shared_ptr<ResultCache> cache,
        std::shared_ptr<QueryStatsTracker> query_stats);

    /**
     * @brief Resolve a payload on the calling thread, without a deadline
     */
    [[nodiscard]] Result<ExecutionOutcome> execute(const RequestPayload& payload);

    /**
     * @brief Resolve a payload on a worker thread, racing `timeout`
     */
    [[nodiscard]] Result<ExecutionOutcome> execute_with_timeout(
        const RequestPayload& payload, std::chrono::milliseconds timeout);

    /**
     * @brief Derive the cache key for an operation and its params
     *
     * "query_" + base64(operation + JSON array of params)
     */
    [[nodiscard]] static std::string make_cache_key(
        const std::string& operation, const std::vector<std::string>& params);

    /// Outcome reported when no worker thread can be started
    [[nodiscard]] static Result<ExecutionOutcome> worker_start_failure(std::string_view reason);

    /// Explicit key when present, derived key otherwise
    [[nodiscard]] static std::string cache_key_for(const RequestPayload& payload);

    [[nodiscard]] const std::shared_ptr<ResultCache>& cache() const { return cache_; }
    [[nodiscard]] const std::shared_ptr<QueryStatsTracker>& query_stats() const { return query_stats_; }

private:
    CachedExecutor(ExecuteFn execute_fn,
                   std::shared_ptr<ResultCache> cache,
                   std::shared_ptr<QueryStatsTracker> query_stats);

    // Outcome of a lookup/callback before anything is published
    struct Resolution {
        Result<ExecutionOutcome> result;
        bool store = false;          // Miss that must be written to the cache
        double elapsed_ms = 0.0;
    };

    struct Attempt;

    [[nodiscard]] Resolution resolve(const RequestPayload& payload);
    void commit(const RequestPayload& payload, const Resolution& resolution);
    [[nodiscard]] Result<std::string> invoke(const RequestPayload& payload);

    ExecuteFn execute_fn_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<QueryStatsTracker> query_stats_;
};

} // namespace loadgate
