#pragma once

#include <optional>
#include <string>

namespace loadgate {

/**
 * @brief Error categories for admitted work
 *
 * Only TIMEOUT_EXCEEDED and EXECUTION_FAILED are ever attached to a ticket.
 * CIRCUIT_OPEN and CAPACITY_EXCEEDED describe why dispatch is being delayed;
 * they show up as latency, never as a ticket failure.
 */
enum class ErrorCategory {
    NONE,
    TIMEOUT_EXCEEDED,
    EXECUTION_FAILED,
    CIRCUIT_OPEN,
    CAPACITY_EXCEEDED,
    INTERNAL_ERROR  // for callbacks; tickets report it as EXECUTION_FAILED
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::TIMEOUT_EXCEEDED:  return "timeout_exceeded";
        case ErrorCategory::EXECUTION_FAILED:  return "execution_failed";
        case ErrorCategory::CIRCUIT_OPEN:      return "circuit_open";
        case ErrorCategory::CAPACITY_EXCEEDED: return "capacity_exceeded";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
        default:                               return "internal_error";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace loadgate
