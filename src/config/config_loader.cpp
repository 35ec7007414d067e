#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace loadgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

SchedulerConfig ConfigLoader::extract_scheduler(const toml::table& root) {
    SchedulerConfig cfg;
    const auto* sched = root["scheduler"].as_table();
    if (!sched) return cfg;
    const auto& s = *sched;

    cfg.max_concurrent_requests = s["max_concurrent_requests"].value_or(cfg.max_concurrent_requests);
    cfg.request_timeout_ms = s["request_timeout_ms"].value_or(cfg.request_timeout_ms);
    cfg.dispatch_mode = s["dispatch_mode"].value_or(cfg.dispatch_mode);
    cfg.open_backoff_ms = s["open_backoff_ms"].value_or(cfg.open_backoff_ms);
    cfg.idle_backoff_ms = s["idle_backoff_ms"].value_or(cfg.idle_backoff_ms);
    return cfg;
}

CircuitBreakerConfig ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerConfig cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.failure_threshold = (*cb)["failure_threshold"].value_or(cfg.failure_threshold);
    cfg.success_threshold = (*cb)["success_threshold"].value_or(cfg.success_threshold);
    cfg.timeout_ms = (*cb)["timeout_ms"].value_or(cfg.timeout_ms);
    return cfg;
}

BurstConfig ConfigLoader::extract_burst(const toml::table& root) {
    BurstConfig cfg;
    const auto* b = root["burst"].as_table();
    if (!b) return cfg;

    cfg.threshold = (*b)["threshold"].value_or(cfg.threshold);
    cfg.window_ms = (*b)["window_ms"].value_or(cfg.window_ms);
    cfg.history_capacity = (*b)["history_capacity"].value_or(cfg.history_capacity);
    return cfg;
}

ResultCacheConfig ConfigLoader::extract_result_cache(const toml::table& root) {
    ResultCacheConfig cfg;
    const auto* rc = root["result_cache"].as_table();
    if (!rc) return cfg;

    cfg.default_ttl_ms = (*rc)["default_ttl_ms"].value_or(cfg.default_ttl_ms);
    cfg.max_entries = (*rc)["max_entries"].value_or(cfg.max_entries);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

LoadgateConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    LoadgateConfig config;
    config.scheduler = extract_scheduler(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.burst = extract_burst(tbl);
    config.result_cache = extract_result_cache(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(LoadgateConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const LoadgateConfig& config) {
    std::vector<std::string> errors;

    // Counts must fit the runtime's uint32_t fields; durations are capped at one week
    constexpr int64_t kMaxCount = std::numeric_limits<uint32_t>::max();
    constexpr int64_t kMaxDurationMs = 7LL * 24 * 60 * 60 * 1000;

    const auto check_count = [&](std::string_view name, int64_t value) {
        if (!utils::in_range<int64_t{1}, kMaxCount>(value)) {
            errors.push_back(std::format("{} must be 1-{}, got {}", name, kMaxCount, value));
        }
    };
    const auto check_duration = [&](std::string_view name, int64_t value) {
        if (!utils::in_range<int64_t{1}, kMaxDurationMs>(value)) {
            errors.push_back(std::format("{} must be 1-{}, got {}", name, kMaxDurationMs, value));
        }
    };

    const auto& s = config.scheduler;
    check_count("scheduler.max_concurrent_requests", s.max_concurrent_requests);
    check_duration("scheduler.request_timeout_ms", s.request_timeout_ms);
    if (!parse_dispatch_mode(s.dispatch_mode)) {
        errors.push_back(std::format(
            "scheduler.dispatch_mode must be 'concurrent' or 'serialized', got '{}'",
            s.dispatch_mode));
    }
    check_duration("scheduler.open_backoff_ms", s.open_backoff_ms);
    check_duration("scheduler.idle_backoff_ms", s.idle_backoff_ms);

    check_count("circuit_breaker.failure_threshold", config.circuit_breaker.failure_threshold);
    check_count("circuit_breaker.success_threshold", config.circuit_breaker.success_threshold);
    check_duration("circuit_breaker.timeout_ms", config.circuit_breaker.timeout_ms);

    check_count("burst.threshold", config.burst.threshold);
    check_duration("burst.window_ms", config.burst.window_ms);
    check_count("burst.history_capacity", config.burst.history_capacity);

    check_duration("result_cache.default_ttl_ms", config.result_cache.default_ttl_ms);
    if (!utils::in_range<int64_t{0}, kMaxCount>(config.result_cache.max_entries)) {
        errors.push_back(std::format("result_cache.max_entries must be 0-{}, got {}",
                                     kMaxCount, config.result_cache.max_entries));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

// ============================================================================
// Runtime conversion
// ============================================================================

AdmissionScheduler::Config to_scheduler_config(const LoadgateConfig& config) {
    using std::chrono::milliseconds;

    AdmissionScheduler::Config out;
    out.max_concurrent_requests = static_cast<uint32_t>(config.scheduler.max_concurrent_requests);
    out.request_timeout = milliseconds(config.scheduler.request_timeout_ms);
    out.dispatch_mode = parse_dispatch_mode(config.scheduler.dispatch_mode)
                            .value_or(DispatchMode::CONCURRENT);
    out.open_backoff = milliseconds(config.scheduler.open_backoff_ms);
    out.idle_backoff = milliseconds(config.scheduler.idle_backoff_ms);

    out.circuit_breaker.failure_threshold =
        static_cast<uint32_t>(config.circuit_breaker.failure_threshold);
    out.circuit_breaker.success_threshold =
        static_cast<uint32_t>(config.circuit_breaker.success_threshold);
    out.circuit_breaker.timeout = milliseconds(config.circuit_breaker.timeout_ms);

    out.burst.threshold = static_cast<uint32_t>(config.burst.threshold);
    out.burst.window = milliseconds(config.burst.window_ms);
    out.burst.history_capacity = static_cast<size_t>(config.burst.history_capacity);

    out.cache.default_ttl = milliseconds(config.result_cache.default_ttl_ms);
    out.cache.max_entries = static_cast<size_t>(config.result_cache.max_entries);
    return out;
}

} // namespace loadgate
