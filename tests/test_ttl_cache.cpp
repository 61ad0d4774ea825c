#include <catch2/catch_test_macros.hpp>

#include "mt/ttl_cache.h"

#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("TTL cache entries", "[ttl_cache]") {
  TtlCache<std::string, int> cache{1h};

  REQUIRE_FALSE(cache.get("a").has_value());

  cache.put("a", 1);
  cache.put("b", 2);
  REQUIRE(cache.get("a") == 1);
  REQUIRE(cache.size() == 2);

  cache.put("a", 3);
  REQUIRE(cache.get("a") == 3);

  cache.invalidate("a");
  REQUIRE_FALSE(cache.get("a").has_value());
  REQUIRE(cache.get("b") == 2);

  cache.clear();
  REQUIRE(cache.size() == 0);
}

TEST_CASE("TTL cache expiry", "[ttl_cache]") {
  TtlCache<std::string, int> cache{1ms};
  cache.put("a", 1);
  std::this_thread::sleep_for(5ms);

  REQUIRE_FALSE(cache.get("a").has_value());
  REQUIRE(cache.size() == 1);
  REQUIRE(cache.purge() == 1);
  REQUIRE(cache.size() == 0);
}

TEST_CASE("TTL cache loader", "[ttl_cache]") {
  TtlCache<std::string, int> cache{1h};
  int n_loads = 0;

  auto load = [&]() -> std::optional<int> {
    n_loads++;
    return 42;
  };

  REQUIRE(cache.get_or_load("a", load) == 42);
  REQUIRE(cache.get_or_load("a", load) == 42);
  REQUIRE(n_loads == 1);

  SECTION("misses are not cached") {
    auto miss = [&]() -> std::optional<int> {
      n_loads++;
      return std::nullopt;
    };
    REQUIRE_FALSE(cache.get_or_load("b", miss).has_value());
    REQUIRE_FALSE(cache.get_or_load("b", miss).has_value());
    REQUIRE(n_loads == 3);
  }
}

TEST_CASE("TTL cache concurrent access", "[ttl_cache]") {
  TtlCache<int, int> cache{1h};
  for (int i = 0; i < 100; i++)
    cache.put(i, i * i);

  std::vector<std::jthread> readers;
  std::vector<int> sums(4, 0);
  for (int t = 0; t < 4; t++)
    readers.emplace_back([&cache, &sums, t] {
      for (int i = 0; i < 100; i++)
        sums[t] += cache.get(i).value_or(0);
      cache.put(100 + t, t);
    });
  readers.clear();

  for (auto sum : sums)
    REQUIRE(sum == 328'350);
  REQUIRE(cache.size() == 104);
}
