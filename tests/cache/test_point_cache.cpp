#include "recache/cache/point_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace recache::cache;
using recache::async::Context;
using namespace std::chrono_literals;

class PointCacheTest : public ::testing::Test {
protected:
    using Cache = PointCache<std::string, int>;

    void SetUp() override { calls = 0; }

    void TearDown() override { cache.reset(); }

    // Producer returning the key length, counting every call.
    Cache::Producer lengthProducer() {
        return [this](const std::string& key,
                      const Context&) -> std::optional<int> {
            calls++;
            return static_cast<int>(key.size());
        };
    }

    // Producer returning how many times it has been called.
    Cache::Producer generationProducer() {
        return [this](const std::string&,
                      const Context&) -> std::optional<int> {
            return ++calls;
        };
    }

    void makeCache(Duration refresh, Duration keep, Cache::Producer producer) {
        cache = std::make_unique<Cache>(refresh, keep, std::move(producer));
    }

    std::atomic<int> calls{0};
    std::unique_ptr<Cache> cache;
};

TEST_F(PointCacheTest, LoadsLazilyOnFirstGet) {
    makeCache(1s, 0ms, lengthProducer());
    EXPECT_EQ(calls.load(), 0);
    EXPECT_FALSE(cache->contains("abc"));

    auto value = cache->get("abc");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 3);
    EXPECT_EQ(calls.load(), 1);

    EXPECT_EQ(cache->get("abc").value(), 3);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(cache->contains("abc"));
    EXPECT_EQ(cache->size(), 1);
}

TEST_F(PointCacheTest, CoalescesConcurrentFirstLoads) {
    makeCache(10s, 0ms,
              [this](const std::string& key,
                     const Context&) -> std::optional<int> {
                  calls++;
                  std::this_thread::sleep_for(50ms);
                  return static_cast<int>(key.size());
              });

    constexpr int kThreads = 16;
    std::atomic<int> found{0};
    std::vector<std::jthread> readers;
    for (int i = 0; i < kThreads; ++i) {
        readers.emplace_back([&] {
            auto value = cache->get("shared");
            if (value && *value == 6) {
                found++;
            }
        });
    }
    readers.clear();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(found.load(), kThreads);
    EXPECT_EQ(cache->statistics().loads, 1);
}

TEST_F(PointCacheTest, SetIsVisibleImmediately) {
    makeCache(1s, 0ms, lengthProducer());
    cache->set("key", 42);

    EXPECT_TRUE(cache->contains("key"));
    EXPECT_EQ(cache->get("key").value(), 42);
    EXPECT_EQ(calls.load(), 0);

    cache->set("key", 7);
    EXPECT_EQ(cache->get("key").value(), 7);
}

TEST_F(PointCacheTest, SetIsVisibleWhileAnotherKeyLoads) {
    std::atomic<bool> started{false};
    makeCache(10s, 0ms,
              [&](const std::string& key,
                  const Context&) -> std::optional<int> {
                  started = true;
                  std::this_thread::sleep_for(300ms);
                  return static_cast<int>(key.size());
              });

    std::jthread loader([&] { (void)cache->get("a"); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    cache->set("b", 5);
    auto value = cache->get("b", Context{}.withTimeout(20ms));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 5);
    EXPECT_FALSE(cache->contains("a"));
}

TEST_F(PointCacheTest, FailedFirstLoadIsNotRetried) {
    makeCache(1s, 0ms,
              [this](const std::string&,
                     const Context&) -> std::optional<int> {
                  calls++;
                  return std::nullopt;
              });

    EXPECT_FALSE(cache->get("key").has_value());
    EXPECT_FALSE(cache->get("key").has_value());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_FALSE(cache->contains("key"));
    EXPECT_EQ(cache->size(), 1);

    auto stats = cache->statistics();
    EXPECT_EQ(stats.loads, 1);
    EXPECT_EQ(stats.load_failures, 1);
    EXPECT_EQ(stats.misses, 2);

    cache->set("key", 5);
    EXPECT_EQ(cache->get("key").value(), 5);
}

TEST_F(PointCacheTest, RemoveForcesRecompute) {
    makeCache(1s, 0ms, generationProducer());
    EXPECT_EQ(cache->get("key").value(), 1);

    EXPECT_TRUE(cache->remove("key"));
    EXPECT_FALSE(cache->remove("key"));
    EXPECT_EQ(cache->get("key").value(), 2);
}

TEST_F(PointCacheTest, ProducerExceptionReleasesWaiters) {
    std::atomic<bool> started{false};
    makeCache(10s, 0ms,
              [&](const std::string&, const Context&) -> std::optional<int> {
                  calls++;
                  started = true;
                  std::this_thread::sleep_for(50ms);
                  throw std::runtime_error("backend unavailable");
              });

    std::atomic<bool> loader_threw{false};
    std::jthread loader([&] {
        try {
            (void)cache->get("key");
        } catch (const std::runtime_error&) {
            loader_threw = true;
        }
    });

    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    auto waited = cache->get("key");
    loader.join();

    EXPECT_TRUE(loader_threw.load());
    EXPECT_FALSE(waited.has_value());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache->statistics().load_failures, 1);
}

TEST_F(PointCacheTest, WaiterGivesUpAtDeadline) {
    std::atomic<bool> started{false};
    makeCache(10s, 0ms,
              [&](const std::string&, const Context&) -> std::optional<int> {
                  started = true;
                  std::this_thread::sleep_for(200ms);
                  return 1;
              });

    std::jthread loader([&] { EXPECT_EQ(cache->get("key").value(), 1); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(cache->get("key", Context{}.withTimeout(20ms)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 150ms);

    // Giving up does not abandon the computation.
    loader.join();
    EXPECT_EQ(cache->get("key").value(), 1);
}

TEST_F(PointCacheTest, WaiterGivesUpOnCancel) {
    std::atomic<bool> started{false};
    makeCache(10s, 0ms,
              [&](const std::string&, const Context&) -> std::optional<int> {
                  started = true;
                  std::this_thread::sleep_for(200ms);
                  return 1;
              });

    std::jthread loader([&] { (void)cache->get("key"); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });
    EXPECT_FALSE(cache->get("key", Context(source.get_token())).has_value());
}

TEST_F(PointCacheTest, ProducerReceivesCallerContext) {
    makeCache(1s, 0ms,
              [this](const std::string&,
                     const Context& ctx) -> std::optional<int> {
                  calls++;
                  if (ctx.done()) {
                      return std::nullopt;
                  }
                  return 1;
              });

    std::stop_source source;
    source.request_stop();
    EXPECT_FALSE(cache->get("key", Context(source.get_token())).has_value());
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(PointCacheTest, SetDuringPendingLoadWins) {
    std::atomic<bool> started{false};
    makeCache(10s, 0ms,
              [&](const std::string&, const Context&) -> std::optional<int> {
                  started = true;
                  std::this_thread::sleep_for(100ms);
                  return 1;
              });

    std::optional<int> loaded;
    std::jthread loader([&] { loaded = cache->get("key"); });
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    cache->set("key", 99);
    loader.join();

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 1);
    EXPECT_EQ(cache->get("key").value(), 99);
}

TEST_F(PointCacheTest, FreshEntriesAreLeftAlone) {
    makeCache(10s, 0ms, generationProducer());
    EXPECT_EQ(cache->get("key").value(), 1);

    cache->sweep();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache->get("key").value(), 1);
    EXPECT_EQ(cache->statistics().refreshes, 0);
}

TEST_F(PointCacheTest, RecentlyReadStaleEntryIsRefreshed) {
    makeCache(100ms, 0ms, generationProducer());
    EXPECT_EQ(cache->get("key").value(), 1);

    int latest = 1;
    const auto until = std::chrono::steady_clock::now() + 1s;
    while (latest == 1 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
        latest = cache->get("key").value();
    }

    EXPECT_GT(latest, 1);
    EXPECT_GE(cache->statistics().refreshes, 1);
    // Every read after the first was served from the cache.
    EXPECT_EQ(cache->statistics().loads, 1);
}

TEST_F(PointCacheTest, ColdEntryIsNotRefreshed) {
    makeCache(50ms, 0ms, generationProducer());
    EXPECT_EQ(cache->get("key").value(), 1);

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache->statistics().refreshes, 0);
    EXPECT_EQ(cache->get("key").value(), 1);
}

TEST_F(PointCacheTest, FailedRefreshKeepsStaleValue) {
    makeCache(60ms, 0ms,
              [this](const std::string&,
                     const Context&) -> std::optional<int> {
                  if (++calls == 1) {
                      return 1;
                  }
                  return std::nullopt;
              });
    EXPECT_EQ(cache->get("key").value(), 1);

    const auto until = std::chrono::steady_clock::now() + 1s;
    while (cache->statistics().refresh_failures == 0 &&
           std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
        EXPECT_EQ(cache->get("key").value(), 1);
    }

    EXPECT_GE(cache->statistics().refresh_failures, 1);
    EXPECT_EQ(cache->get("key").value(), 1);
}

TEST_F(PointCacheTest, RefreshThrowingKeepsStaleValue) {
    makeCache(60ms, 0ms,
              [this](const std::string&,
                     const Context&) -> std::optional<int> {
                  if (++calls == 1) {
                      return 1;
                  }
                  throw std::runtime_error("refresh failed");
              });
    EXPECT_EQ(cache->get("key").value(), 1);

    const auto until = std::chrono::steady_clock::now() + 1s;
    while (cache->statistics().refresh_failures == 0 &&
           std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
        (void)cache->get("key");
    }

    EXPECT_GE(cache->statistics().refresh_failures, 1);
    EXPECT_EQ(cache->get("key").value(), 1);
}

TEST_F(PointCacheTest, RefreshThrowingNonStandardKeepsStaleValue) {
    makeCache(60ms, 0ms,
              [this](const std::string&,
                     const Context&) -> std::optional<int> {
                  if (++calls == 1) {
                      return 1;
                  }
                  throw 42;
              });
    EXPECT_EQ(cache->get("key").value(), 1);

    const auto until = std::chrono::steady_clock::now() + 1s;
    while (cache->statistics().refresh_failures == 0 &&
           std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
        (void)cache->get("key");
    }

    EXPECT_GE(cache->statistics().refresh_failures, 1);
    EXPECT_EQ(cache->get("key").value(), 1);
    EXPECT_FALSE(cache->closed());
}

TEST_F(PointCacheTest, SlowFirstLoadOutlivesKeepTime) {
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    makeCache(40ms, 40ms,
              [&](const std::string&, const Context&) -> std::optional<int> {
                  calls++;
                  const int running = ++in_flight;
                  int seen = max_in_flight.load();
                  while (running > seen &&
                         !max_in_flight.compare_exchange_weak(seen, running)) {
                  }
                  std::this_thread::sleep_for(200ms);
                  --in_flight;
                  return 7;
              });

    std::optional<int> first;
    std::jthread loader([&] { first = cache->get("key"); });

    // Several sweeps pass while the load runs longer than keep_time.
    std::this_thread::sleep_for(120ms);
    auto second = cache->get("key");
    loader.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(max_in_flight.load(), 1);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 7);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 7);
}

TEST_F(PointCacheTest, SweepEvictsExpiredEntries) {
    // Long refresh keeps the maintenance thread out of the way.
    makeCache(10s, 20ms, lengthProducer());
    EXPECT_EQ(cache->get("key").value(), 3);

    std::this_thread::sleep_for(40ms);
    cache->sweep();

    EXPECT_FALSE(cache->contains("key"));
    EXPECT_EQ(cache->size(), 0);
    EXPECT_EQ(cache->statistics().evictions, 1);

    EXPECT_EQ(cache->get("key").value(), 3);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(PointCacheTest, MaintenanceEvictsExpiredEntries) {
    makeCache(40ms, 80ms, lengthProducer());
    EXPECT_EQ(cache->get("key").value(), 3);

    const auto until = std::chrono::steady_clock::now() + 1s;
    while (cache->contains("key") &&
           std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(cache->contains("key"));
    EXPECT_GE(cache->statistics().evictions, 1);
}

TEST_F(PointCacheTest, ZeroKeepTimeNeverEvicts) {
    makeCache(10s, 0ms, lengthProducer());
    (void)cache->get("key");
    std::this_thread::sleep_for(20ms);
    cache->sweep();
    EXPECT_TRUE(cache->contains("key"));
}

TEST_F(PointCacheTest, CloseStopsTheCache) {
    makeCache(1s, 0ms, lengthProducer());
    EXPECT_EQ(cache->get("key").value(), 3);

    cache->close();
    EXPECT_TRUE(cache->closed());
    EXPECT_EQ(cache->size(), 0);

    EXPECT_FALSE(cache->get("key").has_value());
    cache->set("other", 1);
    EXPECT_FALSE(cache->contains("other"));
    EXPECT_EQ(calls.load(), 1);

    EXPECT_NO_THROW(cache->close());
}

TEST_F(PointCacheTest, StatisticsTrackReads) {
    makeCache(1s, 0ms, lengthProducer());
    (void)cache->get("a");
    (void)cache->get("a");
    (void)cache->get("bb");

    auto stats = cache->statistics();
    EXPECT_EQ(stats.loads, 2);
    EXPECT_EQ(stats.misses, 2);
    EXPECT_EQ(stats.hits, 1);
    EXPECT_EQ(stats.load_failures, 0);
    EXPECT_EQ(stats.size, 2);
}

TEST_F(PointCacheTest, Accessors) {
    CacheOptions options;
    options.refresh_interval = 3s;
    options.keep_time = 1h;
    options.shard_count = 4;
    options.name = "lengths";
    cache = std::make_unique<Cache>(options, lengthProducer());

    EXPECT_EQ(cache->refreshInterval(), 3s);
    EXPECT_EQ(cache->keepTime(), 1h);
    EXPECT_EQ(cache->name(), "lengths");
    EXPECT_FALSE(cache->closed());
}

TEST_F(PointCacheTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(makeCache(0ms, 0ms, lengthProducer()), CacheConfigException);
    EXPECT_THROW(makeCache(-1ms, 0ms, lengthProducer()), CacheConfigException);
    EXPECT_THROW(makeCache(1s, -1ms, lengthProducer()), CacheConfigException);
    EXPECT_THROW(makeCache(1s, 0ms, nullptr), CacheConfigException);

    CacheOptions options;
    options.shard_count = 0;
    EXPECT_THROW((Cache(options, lengthProducer())), CacheConfigException);
}

TEST_F(PointCacheTest, ConfigErrorsAreCacheExceptions) {
    EXPECT_THROW(makeCache(0ms, 0ms, lengthProducer()), CacheException);
}

TEST(PointCacheKeyTypeTest, IntegerKeys) {
    PointCache<int, std::string> cache(
        1s, 0ms,
        [](const int& key, const Context&) -> std::optional<std::string> {
            if (key < 0) {
                return std::nullopt;
            }
            return std::to_string(key * 2);
        });

    EXPECT_EQ(cache.get(21).value(), "42");
    EXPECT_FALSE(cache.get(-1).has_value());
}
