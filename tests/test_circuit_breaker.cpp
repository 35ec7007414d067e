#include <catch2/catch_test_macros.hpp>
#include "executor/circuit_breaker.hpp"

#include <thread>

using namespace loadgate;
using namespace std::chrono_literals;

namespace {

CircuitBreaker::Config make_config(uint32_t failures, uint32_t successes,
                                   std::chrono::milliseconds timeout) {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = failures;
    cfg.success_threshold = successes;
    cfg.timeout = timeout;
    return cfg;
}

} // anonymous namespace

TEST_CASE("CircuitBreaker: starts closed", "[circuit_breaker]") {
    CircuitBreaker cb("test");
    CHECK(cb.name() == "test");
    CHECK(cb.config().failure_threshold == 10);
    CHECK(cb.config().timeout == 30000ms);
    CHECK(cb.get_state() == CircuitState::CLOSED);
    CHECK(cb.allow_request());
    CHECK(cb.get_stats().failure_count == 0);
}

TEST_CASE("CircuitBreaker: trips at failure threshold", "[circuit_breaker]") {
    CircuitBreaker cb("test", make_config(3, 5, 5000ms));

    cb.record_failure();
    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::CLOSED);

    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::OPEN);
    CHECK(cb.is_open());
    CHECK_FALSE(cb.allow_request());

    const auto stats = cb.get_stats();
    CHECK(stats.is_open);
    CHECK(stats.trips == 1);
    CHECK(stats.failure_count == 3);
    CHECK(stats.opened_at.has_value());
}

TEST_CASE("CircuitBreaker: outcomes while open are ignored", "[circuit_breaker]") {
    CircuitBreaker cb("test", make_config(2, 5, 5000ms));
    cb.record_failure();
    cb.record_failure();
    REQUIRE(cb.is_open());

    cb.record_failure();
    cb.record_success();

    const auto stats = cb.get_stats();
    CHECK(stats.failure_count == 2);
    CHECK(stats.success_count == 0);
    CHECK(stats.trips == 1);
}

TEST_CASE("CircuitBreaker: closes once cooldown after last failure elapses", "[circuit_breaker]") {
    CircuitBreaker cb("test", make_config(2, 5, 50ms));
    cb.record_failure();
    cb.record_failure();
    REQUIRE(cb.is_open());

    CHECK_FALSE(cb.allow_request());

    std::this_thread::sleep_for(80ms);

    // No half-open state: the first check after cooldown closes outright
    CHECK(cb.allow_request());
    CHECK(cb.get_state() == CircuitState::CLOSED);
    CHECK(cb.get_stats().failure_count == 0);
    CHECK(cb.get_stats().success_count == 0);
}

TEST_CASE("CircuitBreaker: fast heal clears failures after success threshold", "[circuit_breaker]") {
    CircuitBreaker cb("test", make_config(3, 5, 5000ms));
    cb.record_failure();
    cb.record_failure();

    for (int i = 0; i < 4; ++i) {
        cb.record_success();
    }
    CHECK(cb.get_stats().failure_count == 2);
    CHECK(cb.get_stats().success_count == 4);

    cb.record_success();
    CHECK(cb.get_stats().failure_count == 0);
    CHECK(cb.get_stats().success_count == 0);

    // Two more failures do not trip, since the count restarted
    cb.record_failure();
    cb.record_failure();
    CHECK(cb.get_state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: failure does not reset success count", "[circuit_breaker]") {
    CircuitBreaker cb("test", make_config(10, 5, 5000ms));
    cb.record_success();
    cb.record_success();
    cb.record_failure();

    CHECK(cb.get_stats().success_count == 2);
    CHECK(cb.get_stats().failure_count == 1);
}

TEST_CASE("CircuitBreaker: state change events", "[circuit_breaker][events]") {
    CircuitBreaker cb("cycle", make_config(2, 5, 20ms));

    std::vector<StateChangeEvent> captured;
    cb.set_on_state_change([&](const StateChangeEvent& e) {
        captured.push_back(e);
    });

    cb.record_failure();
    cb.record_failure();
    std::this_thread::sleep_for(50ms);
    REQUIRE(cb.allow_request());

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].from == CircuitState::CLOSED);
    CHECK(captured[0].to == CircuitState::OPEN);
    CHECK(captured[0].failure_count == 2);
    CHECK(captured[0].breaker_name == "cycle");
    CHECK(captured[1].from == CircuitState::OPEN);
    CHECK(captured[1].to == CircuitState::CLOSED);

    CHECK(cb.get_recent_events().size() == 2);
}

TEST_CASE("CircuitBreaker: reset returns to closed", "[circuit_breaker]") {
    CircuitBreaker cb("test", make_config(1, 5, 60000ms));
    cb.record_failure();
    REQUIRE(cb.is_open());

    cb.reset();

    CHECK(cb.get_state() == CircuitState::CLOSED);
    CHECK(cb.allow_request());
    CHECK(cb.get_recent_events().empty());
}
