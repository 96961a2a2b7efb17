#include <doctest/doctest.h>

#include <atomic>
#include <boost/json.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "duckmcp/cache.hpp"

namespace json = boost::json;
using duckmcp::cache_options;
using duckmcp::search_cache;
using namespace std::chrono_literals;

namespace {

// Manually advanced clock shared with the cache under test.
struct fake_clock {
  search_cache::clock_t::time_point now{};
  search_cache::clock_fn fn() {
    return [this] { return now; };
  }
};

json::value payload(int n) {
  json::object obj;
  obj["n"] = n;
  return obj;
}

}  // namespace

TEST_CASE("cache-fingerprint") {
  // md5("hello:5")
  CHECK(search_cache::fingerprint("hello", 5) ==
        "05a9a048433ad10b94131fb80390095c");
  CHECK(search_cache::fingerprint("hello", 5) !=
        search_cache::fingerprint("hello", 6));
  CHECK(search_cache::fingerprint("hello", 5) !=
        search_cache::fingerprint("Hello", 5));
}

TEST_CASE("cache-hit-and-ttl") {
  fake_clock clock;
  search_cache cache{cache_options{true, 60s, 10}, clock.fn()};

  CHECK_FALSE(cache.lookup("q", 5).has_value());
  cache.store("q", 5, payload(1));

  auto hit = cache.lookup("q", 5);
  REQUIRE(hit.has_value());
  CHECK(hit->as_object().at("n").as_int64() == 1);

  // Different count is a different key.
  CHECK_FALSE(cache.lookup("q", 6).has_value());

  clock.now += 60s;
  CHECK(cache.lookup("q", 5).has_value());

  clock.now += 1s;
  CHECK_FALSE(cache.lookup("q", 5).has_value());
  // Expired entries are dropped on lookup.
  CHECK(cache.stats().size == 0);
}

TEST_CASE("cache-evicts-oldest-insertion") {
  fake_clock clock;
  search_cache cache{cache_options{true, 3600s, 2}, clock.fn()};

  cache.store("a", 5, payload(1));
  clock.now += 1s;
  cache.store("b", 5, payload(2));
  clock.now += 1s;

  // Reads do not refresh recency.
  CHECK(cache.lookup("a", 5).has_value());

  cache.store("c", 5, payload(3));
  CHECK(cache.stats().size == 2);
  CHECK_FALSE(cache.lookup("a", 5).has_value());
  CHECK(cache.lookup("b", 5).has_value());
  CHECK(cache.lookup("c", 5).has_value());
}

TEST_CASE("cache-eviction-ties-follow-insertion-order") {
  fake_clock clock;
  search_cache cache{cache_options{true, 3600s, 2}, clock.fn()};

  cache.store("first", 5, payload(1));
  cache.store("second", 5, payload(2));
  cache.store("third", 5, payload(3));

  CHECK_FALSE(cache.lookup("first", 5).has_value());
  CHECK(cache.lookup("second", 5).has_value());
  CHECK(cache.lookup("third", 5).has_value());
}

TEST_CASE("cache-overwrite-does-not-evict") {
  fake_clock clock;
  search_cache cache{cache_options{true, 3600s, 2}, clock.fn()};

  cache.store("a", 5, payload(1));
  cache.store("b", 5, payload(2));
  cache.store("a", 5, payload(10));

  CHECK(cache.stats().size == 2);
  REQUIRE(cache.lookup("a", 5).has_value());
  CHECK(cache.lookup("a", 5)->as_object().at("n").as_int64() == 10);
  CHECK(cache.lookup("b", 5).has_value());

  // The overwrite refreshed "a", so "b" is now the oldest.
  clock.now += 1s;
  cache.store("c", 5, payload(3));
  CHECK_FALSE(cache.lookup("b", 5).has_value());
  CHECK(cache.lookup("a", 5).has_value());
}

TEST_CASE("cache-disabled") {
  search_cache cache{cache_options{false, 3600s, 10}};
  cache.store("q", 5, payload(1));
  CHECK_FALSE(cache.lookup("q", 5).has_value());

  auto stats = cache.stats();
  CHECK_FALSE(stats.enabled);
  CHECK(stats.size == 0);
}

TEST_CASE("cache-clear-and-stats") {
  search_cache cache{cache_options{true, 120s, 7}};
  cache.store("a", 1, payload(1));
  cache.store("b", 1, payload(2));

  auto stats = cache.stats();
  CHECK(stats.enabled);
  CHECK(stats.size == 2);
  CHECK(stats.max_size == 7);
  CHECK(stats.ttl == 120s);

  cache.clear();
  CHECK(cache.stats().size == 0);
  CHECK_FALSE(cache.lookup("a", 1).has_value());
}

TEST_CASE("cache-concurrent-stores-respect-capacity") {
  constexpr int kThreads{8};
  constexpr int kKeysPerThread{50};
  search_cache cache{cache_options{true, 3600s, 10}};
  std::atomic<bool> overflowed{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&cache, &overflowed, t] {
      for (int i = 0; i < kKeysPerThread; ++i) {
        auto key = "t" + std::to_string(t) + "-" + std::to_string(i);
        cache.store(key, 5, payload(i));
        if (cache.stats().size > 10) overflowed = true;
      }
    });
  }
  for (auto& th : threads) th.join();

  CHECK_FALSE(overflowed.load());
  CHECK(cache.stats().size == 10);
}
