#include <catch2/catch_test_macros.hpp>
#include "server/stats_reporter.hpp"

#include <limits>

using namespace loadgate;

TEST_CASE("StatsReporter: renders counters and breaker state", "[stats]") {
    SchedulerSnapshot snap;
    snap.enabled = true;
    snap.total_requests = 12;
    snap.completed_requests = 9;
    snap.failed_requests = 2;
    snap.average_response_time_ms = 150.25;
    snap.circuit_breaker.state = CircuitState::OPEN;
    snap.circuit_breaker.is_open = true;
    snap.circuit_breaker.failure_count = 10;

    const auto json = stats_to_json(snap);

    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
    CHECK(json.find("\"enabled\":true") != std::string::npos);
    CHECK(json.find("\"dispatch_mode\":\"concurrent\"") != std::string::npos);
    CHECK(json.find("\"total_requests\":12") != std::string::npos);
    CHECK(json.find("\"average_response_time_ms\":150.25") != std::string::npos);
    CHECK(json.find("\"state\":\"open\",\"is_open\":true,\"failure_count\":10") != std::string::npos);
    CHECK(json.find("\"last_burst_time\":null") != std::string::npos);
}

TEST_CASE("StatsReporter: queue sizes by lane name", "[stats]") {
    SchedulerSnapshot snap;
    snap.queue_sizes[priority_index(PriorityLevel::CRITICAL)] = 1;
    snap.queue_sizes[priority_index(PriorityLevel::LOW)] = 3;
    snap.total_queue_size = 4;

    const auto json = stats_to_json(snap);
    CHECK(json.find("\"queue_sizes\":{\"critical\":1,\"high\":0,\"normal\":0,\"low\":3}")
          != std::string::npos);
    CHECK(json.find("\"total_queue_size\":4") != std::string::npos);
}

TEST_CASE("StatsReporter: cache keys and query stats are escaped", "[stats]") {
    SchedulerSnapshot snap;
    snap.cache_size = 1;
    snap.cache_keys = {"query_abc"};

    QueryStats unused;  // min stays at +inf until the first sample
    snap.query_stats["SELECT \"x\""] = unused;

    const auto json = stats_to_json(snap);
    CHECK(json.find("\"cache\":{\"size\":1,\"keys\":[\"query_abc\"]}") != std::string::npos);
    CHECK(json.find("\"SELECT \\\"x\\\"\":{\"count\":0") != std::string::npos);
    CHECK(json.find("\"min_time_ms\":0.00") != std::string::npos);
    CHECK(json.find(":inf") == std::string::npos);
}
