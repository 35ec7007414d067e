#include <catch2/catch_test_macros.hpp>
#include "cache/result_cache.hpp"

#include <chrono>
#include <thread>

using namespace loadgate;
using namespace std::chrono_literals;

TEST_CASE("ResultCache: miss on unknown key", "[cache]") {
    ResultCache cache;

    CHECK_FALSE(cache.get("missing").has_value());
    CHECK(cache.get_stats().misses == 1);
    CHECK(cache.size() == 0);
}

TEST_CASE("ResultCache: put then get returns same value", "[cache]") {
    ResultCache cache;
    cache.put("query_abc", "payload");

    auto cached = cache.get("query_abc");
    REQUIRE(cached.has_value());
    CHECK(*cached == "payload");
    CHECK(cache.get_stats().hits == 1);
}

TEST_CASE("ResultCache: TTL is supplied by the reader", "[cache]") {
    ResultCache cache;
    cache.put("k", "v");

    std::this_thread::sleep_for(30ms);

    CHECK_FALSE(cache.get("k", 10ms).has_value());
    CHECK(cache.get("k", 10000ms).has_value());
}

TEST_CASE("ResultCache: stale entries stay until overwritten", "[cache]") {
    ResultCache cache;
    cache.put("k", "old");
    std::this_thread::sleep_for(20ms);

    CHECK_FALSE(cache.get("k", 5ms).has_value());
    CHECK(cache.size() == 1);

    cache.put("k", "new");
    auto fresh = cache.get("k", 5000ms);
    REQUIRE(fresh.has_value());
    CHECK(*fresh == "new");
    CHECK(cache.size() == 1);
}

TEST_CASE("ResultCache: unbounded by default", "[cache]") {
    ResultCache cache;
    for (int i = 0; i < 500; ++i) {
        cache.put("key_" + std::to_string(i), "v");
    }
    CHECK(cache.size() == 500);
    CHECK(cache.get_stats().evictions == 0);
}

TEST_CASE("ResultCache: LRU bound evicts least recently used", "[cache]") {
    ResultCache::Config cfg;
    cfg.max_entries = 2;
    ResultCache cache(cfg);

    cache.put("a", "1");
    cache.put("b", "2");
    CHECK(cache.get("a").has_value());  // a becomes most recent

    cache.put("c", "3");

    CHECK(cache.size() == 2);
    CHECK(cache.get("a").has_value());
    CHECK_FALSE(cache.get("b").has_value());
    CHECK(cache.get("c").has_value());
    CHECK(cache.get_stats().evictions == 1);
}

TEST_CASE("ResultCache: keys are listed most recent first", "[cache]") {
    ResultCache cache;
    cache.put("first", "1");
    cache.put("second", "2");

    const auto keys = cache.keys();
    REQUIRE(keys.size() == 2);
    CHECK(keys[0] == "second");
    CHECK(keys[1] == "first");
}

TEST_CASE("ResultCache: clear empties the store", "[cache]") {
    ResultCache cache;
    cache.put("a", "1");
    cache.put("b", "2");

    cache.clear();

    CHECK(cache.size() == 0);
    CHECK(cache.keys().empty());
    CHECK_FALSE(cache.get("a").has_value());
}
