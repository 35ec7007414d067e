#pragma once

#include "server/admission_scheduler.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace loadgate {

// Integer settings are held as int64_t; validate_config enforces their ranges.

// ============================================================================
// Scheduler Config (mirrors TOML hierarchy)
// ============================================================================

struct SchedulerConfig {
    int64_t max_concurrent_requests = 150;
    int64_t request_timeout_ms = 10000;
    std::string dispatch_mode = "concurrent";
    int64_t open_backoff_ms = 1000;
    int64_t idle_backoff_ms = 100;
};

// ============================================================================
// Circuit Breaker Config
// ============================================================================

struct CircuitBreakerConfig {
    int64_t failure_threshold = 10;
    int64_t success_threshold = 5;
    int64_t timeout_ms = 30000;
};

// ============================================================================
// Burst Detection Config
// ============================================================================

struct BurstConfig {
    int64_t threshold = 50;
    int64_t window_ms = 60000;
    int64_t history_capacity = 1000;
};

// ============================================================================
// Result Cache Config
// ============================================================================

struct ResultCacheConfig {
    int64_t default_ttl_ms = 300000;
    int64_t max_entries = 0;  // 0 = unbounded
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct LoadgateConfig {
    SchedulerConfig scheduler;
    CircuitBreakerConfig circuit_breaker;
    BurstConfig burst;
    ResultCacheConfig result_cache;
    LoggingConfig logging;
};

/**
 * @brief Convert validated file config into the scheduler's runtime config
 *
 * Expects a config that passed ConfigLoader validation.
 */
[[nodiscard]] AdmissionScheduler::Config to_scheduler_config(const LoadgateConfig& config);

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        LoadgateConfig config;

        static LoadResult ok(LoadgateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to loadgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// @return every violation found; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const LoadgateConfig& config);

private:
    static SchedulerConfig extract_scheduler(const toml::table& root);
    static CircuitBreakerConfig extract_circuit_breaker(const toml::table& root);
    static BurstConfig extract_burst(const toml::table& root);
    static ResultCacheConfig extract_result_cache(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadgateConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(LoadgateConfig config);
};

} // namespace loadgate
