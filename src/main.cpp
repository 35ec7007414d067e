#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "server/admission_scheduler.hpp"
#include "server/stats_reporter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <format>
#include <memory>
#include <random>
#include <string>
#include <thread>

using namespace loadgate;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*signal*/) {
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

// Stand-in persistence layer: answers after 100-300ms
Result<std::string> simulated_execute(const RequestPayload& payload) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> delay_ms(100, 300);
    std::uniform_real_distribution<double> exec_ms(50.0, 150.0);

    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms(rng)));

    std::string params = "[";
    for (size_t i = 0; i < payload.params.size(); ++i) {
        if (i > 0) params += ",";
        params += std::format("\"{}\"", utils::escape_json(payload.params[i]));
    }
    params += "]";

    return Result<std::string>::ok(std::format(
        "{{\"message\":\"Query executed directly\",\"query\":\"{}...\",\"params\":{},"
        "\"timestamp\":\"{}\",\"execution_time_ms\":{:.1f}}}",
        utils::escape_json(payload.operation.substr(0, 50)), params,
        utils::format_timestamp(std::chrono::system_clock::now()), exec_ms(rng)));
}

void log_event(const SchedulerEvent& event) {
    switch (event.type) {
        case SchedulerEventType::REQUEST_ADDED:
            utils::log::info(std::format("Request {} queued (priority: {})",
                event.ticket_id, priority_to_string(event.priority)));
            break;
        case SchedulerEventType::REQUEST_COMPLETED:
            utils::log::info(std::format("Request {} completed (priority: {}{})",
                event.ticket_id, priority_to_string(event.priority),
                event.from_cache ? ", cached" : ""));
            break;
        case SchedulerEventType::REQUEST_FAILED:
            utils::log::warn(std::format("Request {} failed: {}",
                event.ticket_id, event.error_message));
            break;
        default:
            // Burst, breaker and lifecycle events are logged by the scheduler
            break;
    }
}

std::string today() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Load gate starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/loadgate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));

        LoadgateConfig config;
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (config_result.success) {
            config = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("{} - using built-in defaults",
                                         config_result.error_message));
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        const auto scheduler_config = to_scheduler_config(config);
        utils::log::info(std::format(
            "[2/3] Scheduler: max {} in flight, timeout {}ms, breaker {}/{}ms, burst {}/{}ms",
            scheduler_config.max_concurrent_requests,
            scheduler_config.request_timeout.count(),
            scheduler_config.circuit_breaker.failure_threshold,
            scheduler_config.circuit_breaker.timeout.count(),
            scheduler_config.burst.threshold,
            scheduler_config.burst.window.count()));

        auto scheduler = std::make_unique<AdmissionScheduler>(scheduler_config, simulated_execute);
        scheduler->subscribe(log_event);
        scheduler->enable();

        utils::log::info("[3/3] Admitting sample queries");
        scheduler->enqueue(RequestPayload("SELECT * FROM siswa WHERE status = ?", {"aktif"}, true),
                           kPriorityHigh);
        scheduler->enqueue(RequestPayload("SELECT * FROM guru WHERE status = ?", {"aktif"}, true),
                           kPriorityHigh);
        scheduler->enqueue(RequestPayload("SELECT * FROM kelas WHERE status = ?", {"aktif"}, true),
                           kPriorityNormal);
        scheduler->enqueue(RequestPayload("SELECT COUNT(*) as total FROM absensi_siswa WHERE tanggal = ?",
                                          {today()}, true),
                           kPriorityCritical);

        // Run until everything settles or a signal arrives
        const auto deadline = std::chrono::steady_clock::now() +
                              scheduler_config.request_timeout * 2;
        while (!g_shutdown_requested.load(std::memory_order_relaxed)) {
            if (scheduler->wait_until_idle(std::chrono::milliseconds(200))) break;
            if (std::chrono::steady_clock::now() >= deadline) {
                utils::log::warn("Requests still pending at deadline");
                break;
            }
        }

        if (g_shutdown_requested.load(std::memory_order_relaxed)) {
            utils::log::info("Shutdown requested, stopping...");
        }

        std::printf("%s\n", stats_to_json(scheduler->get_stats()).c_str());
        scheduler->stop();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
