#include "executor/cached_executor.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace loadgate {

// Shared between the waiting dispatcher and the detached worker
struct CachedExecutor::Attempt {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    std::optional<Result<ExecutionOutcome>> result;
};

std::shared_ptr<CachedExecutor> CachedExecutor::create(
    ExecuteFn execute_fn,
    std::shared_ptr<ResultCache> cache,
    std::shared_ptr<QueryStatsTracker> query_stats) {
    return std::shared_ptr<CachedExecutor>(new CachedExecutor(
        std::move(execute_fn), std::move(cache), std::move(query_stats)));
}

CachedExecutor::CachedExecutor(ExecuteFn execute_fn,
                               std::shared_ptr<ResultCache> cache,
                               std::shared_ptr<QueryStatsTracker> query_stats)
    : execute_fn_(std::move(execute_fn)),
      cache_(std::move(cache)),
      query_stats_(std::move(query_stats)) {
    if (!execute_fn_) {
        throw std::invalid_argument("CachedExecutor requires an execution callback");
    }
    if (!cache_) {
        cache_ = std::make_shared<ResultCache>();
    }
    if (!query_stats_) {
        query_stats_ = std::make_shared<QueryStatsTracker>();
    }
}

// ============================================================================
// Cache keys
// ============================================================================

std::string CachedExecutor::make_cache_key(
    const std::string& operation, const std::vector<std::string>& params) {
    std::string descriptor = operation;
    descriptor += '[';
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) descriptor += ',';
        descriptor += '"';
        descriptor += utils::escape_json(params[i]);
        descriptor += '"';
    }
    descriptor += ']';
    return "query_" + base64::encode(descriptor);
}

std::string CachedExecutor::cache_key_for(const RequestPayload& payload) {
    if (payload.cache_key && !payload.cache_key->empty()) {
        return *payload.cache_key;
    }
    return make_cache_key(payload.operation, payload.params);
}

// ============================================================================
// Execution
// ============================================================================

Result<ExecutionOutcome> CachedExecutor::execute(const RequestPayload& payload) {
    auto resolution = resolve(payload);
    commit(payload, resolution);
    return std::move(resolution.result);
}

Result<ExecutionOutcome> CachedExecutor::execute_with_timeout(
    const RequestPayload& payload, std::chrono::milliseconds timeout) {
    auto attempt = std::make_shared<Attempt>();

    try {
        std::thread([self = shared_from_this(), attempt, payload] {
            auto resolution = self->resolve(payload);

            std::lock_guard lock(attempt->mutex);
            if (attempt->abandoned) {
                return;  // Deadline passed; result discarded
            }
            self->commit(payload, resolution);
            attempt->result = std::move(resolution.result);
            attempt->done = true;
            attempt->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        return worker_start_failure(e.what());
    }

    std::unique_lock lock(attempt->mutex);
    if (!attempt->cv.wait_for(lock, timeout, [&] { return attempt->done; })) {
        attempt->abandoned = true;
        lock.unlock();
        query_stats_->record(payload.operation, static_cast<double>(timeout.count()), false);
        return Result<ExecutionOutcome>::error(
            ErrorCategory::TIMEOUT_EXCEEDED,
            std::format("Request timeout after {}ms", timeout.count()));
    }
    return std::move(*attempt->result);
}

Result<ExecutionOutcome> CachedExecutor::worker_start_failure(std::string_view reason) {
    return Result<ExecutionOutcome>::error(
        ErrorCategory::EXECUTION_FAILED,
        std::format("Failed to start execution worker: {}", reason));
}

CachedExecutor::Resolution CachedExecutor::resolve(const RequestPayload& payload) {
    utils::Timer timer;

    if (!payload.cacheable) {
        auto raw = invoke(payload);
        if (raw.is_error()) {
            return {Result<ExecutionOutcome>::error(raw.error_category(), raw.error_message()),
                    false, timer.elapsed_ms_precise()};
        }
        return {Result<ExecutionOutcome>::ok({std::move(raw.value()), false, ""}),
                false, timer.elapsed_ms_precise()};
    }

    const auto key = cache_key_for(payload);
    const auto ttl = payload.cache_ttl.value_or(cache_->default_ttl());

    if (auto cached = cache_->get(key, ttl)) {
        return {Result<ExecutionOutcome>::ok({std::move(*cached), true, key}),
                false, timer.elapsed_ms_precise()};
    }

    auto raw = invoke(payload);
    if (raw.is_error()) {
        return {Result<ExecutionOutcome>::error(raw.error_category(), raw.error_message()),
                false, timer.elapsed_ms_precise()};
    }
    return {Result<ExecutionOutcome>::ok({std::move(raw.value()), false, key}),
            true, timer.elapsed_ms_precise()};
}

void CachedExecutor::commit(const RequestPayload& payload, const Resolution& resolution) {
    if (resolution.result.is_error()) {
        query_stats_->record(payload.operation, resolution.elapsed_ms, false);
        return;
    }

    const auto& outcome = resolution.result.value();
    if (outcome.from_cache) {
        query_stats_->record("cached_" + outcome.cache_key, resolution.elapsed_ms, true);
        return;
    }

    if (resolution.store) {
        cache_->put(outcome.cache_key, outcome.data);
    }
    query_stats_->record(payload.operation, resolution.elapsed_ms, true);
}

Result<std::string> CachedExecutor::invoke(const RequestPayload& payload) {
    try {
        auto result = execute_fn_(payload);
        if (result.is_error()) {
            // Callback errors are opaque to the scheduler
            return Result<std::string>::error(ErrorCategory::EXECUTION_FAILED,
                                              result.error_message());
        }
        return result;
    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCategory::EXECUTION_FAILED, e.what());
    }
}

} // namespace loadgate
