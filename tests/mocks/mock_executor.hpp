#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace loadgate::testing {

/**
 * @brief Scriptable stand-in for the persistence callback
 *
 * Records the order in which operations were executed and tracks the
 * highest number of concurrent invocations.
 */
class MockExecutor {
public:
    enum class Mode { SUCCEED, FAIL, THROW };

    explicit MockExecutor(Mode mode = Mode::SUCCEED,
                          std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : mode_(mode), delay_(delay) {}

    [[nodiscard]] ExecuteFn callback() {
        return [this](const RequestPayload& payload) { return run(payload); };
    }

    Result<std::string> run(const RequestPayload& payload) {
        const int now_running = running_.fetch_add(1) + 1;
        int peak = peak_running_.load();
        while (now_running > peak && !peak_running_.compare_exchange_weak(peak, now_running)) {}

        if (delay_.load().count() > 0) {
            std::this_thread::sleep_for(delay_.load());
        }

        {
            std::lock_guard lock(mutex_);
            order_.push_back(payload.operation);
        }
        execute_count_.fetch_add(1, std::memory_order_relaxed);
        running_.fetch_sub(1);

        switch (mode_.load()) {
            case Mode::FAIL:
                return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                                                  "Mock failure: " + payload.operation);
            case Mode::THROW:
                throw std::runtime_error("Mock exception: " + payload.operation);
            default:
                return Result<std::string>::ok("result:" + payload.operation);
        }
    }

    [[nodiscard]] uint64_t execute_count() const {
        return execute_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] int peak_running() const { return peak_running_.load(); }

    [[nodiscard]] std::vector<std::string> order() const {
        std::lock_guard lock(mutex_);
        return order_;
    }

    void set_mode(Mode mode) { mode_.store(mode); }
    void set_delay(std::chrono::milliseconds delay) { delay_.store(delay); }

private:
    std::atomic<Mode> mode_;
    std::atomic<std::chrono::milliseconds> delay_;
    std::atomic<uint64_t> execute_count_{0};
    std::atomic<int> running_{0};
    std::atomic<int> peak_running_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
};

} // namespace loadgate::testing
