#include <catch2/catch_test_macros.hpp>
#include "executor/cached_executor.hpp"
#include "core/base64.hpp"
#include "mocks/mock_executor.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace loadgate;
using namespace loadgate::testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<CachedExecutor> make_executor(MockExecutor& mock) {
    return CachedExecutor::create(mock.callback(),
                                  std::make_shared<ResultCache>(),
                                  std::make_shared<QueryStatsTracker>());
}

RequestPayload cacheable(const std::string& op, std::chrono::milliseconds ttl) {
    RequestPayload p(op, {"aktif"}, true);
    p.cache_ttl = ttl;
    return p;
}

} // anonymous namespace

TEST_CASE("CachedExecutor: rejects empty callback", "[cached_executor]") {
    CHECK_THROWS_AS(CachedExecutor::create(ExecuteFn{}, nullptr, nullptr), std::invalid_argument);
}

TEST_CASE("CachedExecutor: derived cache key", "[cached_executor]") {
    const auto key = CachedExecutor::make_cache_key("SELECT 1", {"a", "b"});
    CHECK(key == "query_" + base64::encode(std::string_view("SELECT 1[\"a\",\"b\"]")));

    RequestPayload explicit_key("SELECT 1");
    explicit_key.cache_key = "custom";
    CHECK(CachedExecutor::cache_key_for(explicit_key) == "custom");

    RequestPayload derived("SELECT 1", {"a", "b"}, true);
    CHECK(CachedExecutor::cache_key_for(derived) == key);
}

TEST_CASE("CachedExecutor: hit within TTL skips the callback", "[cached_executor]") {
    MockExecutor mock;
    auto executor = make_executor(mock);
    const auto payload = cacheable("SELECT * FROM siswa", 100ms);

    auto first = executor->execute(payload);
    REQUIRE(first.is_ok());
    CHECK_FALSE(first.value().from_cache);

    auto second = executor->execute(payload);
    REQUIRE(second.is_ok());
    CHECK(second.value().from_cache);
    CHECK(second.value().data == first.value().data);
    CHECK(mock.execute_count() == 1);

    const auto stats = executor->query_stats()->snapshot();
    CHECK(stats.at("SELECT * FROM siswa").count == 1);
    CHECK(stats.contains("cached_" + CachedExecutor::cache_key_for(payload)));
    CHECK(executor->query_stats()->size() == 2);
}

TEST_CASE("CachedExecutor: stale entry re-executes and refreshes", "[cached_executor]") {
    MockExecutor mock;
    auto executor = make_executor(mock);
    const auto payload = cacheable("SELECT * FROM guru", 100ms);

    REQUIRE(executor->execute(payload).is_ok());
    std::this_thread::sleep_for(150ms);

    auto again = executor->execute(payload);
    REQUIRE(again.is_ok());
    CHECK_FALSE(again.value().from_cache);
    CHECK(mock.execute_count() == 2);

    // Refreshed entry serves the next lookup
    auto third = executor->execute(payload);
    REQUIRE(third.is_ok());
    CHECK(third.value().from_cache);
    CHECK(mock.execute_count() == 2);
}

TEST_CASE("CachedExecutor: non-cacheable payloads always execute", "[cached_executor]") {
    MockExecutor mock;
    auto executor = make_executor(mock);
    const RequestPayload payload("INSERT INTO absensi_siswa VALUES (?)", {"1"}, false);

    REQUIRE(executor->execute(payload).is_ok());
    REQUIRE(executor->execute(payload).is_ok());

    CHECK(mock.execute_count() == 2);
    CHECK(executor->cache()->size() == 0);
}

TEST_CASE("CachedExecutor: callback errors become EXECUTION_FAILED", "[cached_executor]") {
    SECTION("error result") {
        MockExecutor mock(MockExecutor::Mode::FAIL);
        auto executor = make_executor(mock);
        auto result = executor->execute(cacheable("SELECT x", 1000ms));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EXECUTION_FAILED);
        CHECK(result.error_message() == "Mock failure: SELECT x");
        CHECK(executor->cache()->size() == 0);
    }

    SECTION("thrown exception") {
        MockExecutor mock(MockExecutor::Mode::THROW);
        auto executor = make_executor(mock);
        auto result = executor->execute(cacheable("SELECT y", 1000ms));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EXECUTION_FAILED);
        CHECK(result.error_message() == "Mock exception: SELECT y");
        CHECK(executor->query_stats()->snapshot().at("SELECT y").failure_count == 1);
    }
}

TEST_CASE("CachedExecutor: timeout discards the late result", "[cached_executor][timeout]") {
    auto mock = std::make_shared<MockExecutor>(MockExecutor::Mode::SUCCEED, 200ms);
    auto executor = CachedExecutor::create(
        [mock](const RequestPayload& p) { return mock->run(p); },
        std::make_shared<ResultCache>(), std::make_shared<QueryStatsTracker>());
    const auto payload = cacheable("SELECT slow", 60000ms);

    const auto start = std::chrono::steady_clock::now();
    auto result = executor->execute_with_timeout(payload, 50ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::TIMEOUT_EXCEEDED);
    CHECK(result.error_message() == "Request timeout after 50ms");
    CHECK(waited < 190ms);

    // Let the worker finish; its result must not reach the cache
    std::this_thread::sleep_for(300ms);
    CHECK(mock->execute_count() == 1);
    CHECK(executor->cache()->size() == 0);

    const auto stats = executor->query_stats()->snapshot().at("SELECT slow");
    CHECK(stats.failure_count == 1);
    CHECK(stats.success_count == 0);
}

TEST_CASE("CachedExecutor: fast execution beats the deadline", "[cached_executor][timeout]") {
    MockExecutor mock(MockExecutor::Mode::SUCCEED, 10ms);
    auto executor = make_executor(mock);

    auto result = executor->execute_with_timeout(cacheable("SELECT fast", 60000ms), 1000ms);
    REQUIRE(result.is_ok());
    CHECK(result.value().data == "result:SELECT fast");
    CHECK(executor->cache()->size() == 1);
}

TEST_CASE("CachedExecutor: worker start failure is an execution failure", "[cached_executor]") {
    const auto result = CachedExecutor::worker_start_failure("Resource temporarily unavailable");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::EXECUTION_FAILED);
    CHECK(result.error_message() ==
          "Failed to start execution worker: Resource temporarily unavailable");
}
