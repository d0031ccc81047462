/*
 * common.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file common.hpp
 * @brief Configuration, statistics and errors shared by the refreshing caches
 */

#ifndef RECACHE_CACHE_COMMON_HPP
#define RECACHE_CACHE_COMMON_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace recache::cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/**
 * @brief Base class for errors raised by the caches.
 */
class CacheException : public std::runtime_error {
public:
    explicit CacheException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a cache is constructed with unusable settings.
 */
class CacheConfigException : public CacheException {
public:
    explicit CacheConfigException(const std::string& message)
        : CacheException(message) {}
};

/**
 * @brief Configuration options shared by PointCache and BulkCache.
 */
struct CacheOptions {
    /// Target staleness window. Entries younger than this are never
    /// refreshed.
    Duration refresh_interval{std::chrono::seconds(60)};
    /// Hard age ceiling after which an entry is evicted. Zero disables age
    /// eviction.
    Duration keep_time{0};
    /// Number of lock shards in the underlying map.
    std::size_t shard_count{16};
    /// Label used in log messages.
    std::string name{"default"};

    /**
     * @brief Checks the options, throwing on values the caches cannot run
     * with.
     *
     * A keep_time shorter than refresh_interval is legal but evicts entries
     * before they could ever be refreshed, so it only produces a warning.
     *
     * @throws CacheConfigException on invalid settings.
     */
    void validate() const {
        if (refresh_interval <= Duration::zero()) {
            throw CacheConfigException(
                "refresh_interval must be greater than zero");
        }
        if (keep_time < Duration::zero()) {
            throw CacheConfigException("keep_time must not be negative");
        }
        if (shard_count == 0) {
            throw CacheConfigException(
                "shard_count must be greater than zero");
        }
        if (keep_time > Duration::zero() && keep_time < refresh_interval) {
            spdlog::warn(
                "cache '{}': keep_time {}ms is shorter than refresh_interval "
                "{}ms; entries will be evicted before they are refreshed",
                name, keep_time.count(), refresh_interval.count());
        }
    }
};

/**
 * @brief Cache statistics for monitoring refresh behaviour.
 */
struct CacheStatistics {
    std::size_t hits{0};              ///< Reads served from an existing entry.
    std::size_t misses{0};            ///< First loads plus failed reads.
    std::size_t loads{0};             ///< Producer calls made for readers.
    std::size_t load_failures{0};     ///< Of those, calls that failed.
    std::size_t refreshes{0};         ///< Producer calls made in background.
    std::size_t refresh_failures{0};  ///< Of those, calls that failed.
    std::size_t evictions{0};         ///< Entries removed for age.
    std::size_t size{0};              ///< Entries currently stored.
};

namespace detail {

/**
 * @brief Relaxed atomic counters backing CacheStatistics.
 */
struct StatisticsCounters {
    std::atomic<std::size_t> hits{0};
    std::atomic<std::size_t> misses{0};
    std::atomic<std::size_t> loads{0};
    std::atomic<std::size_t> load_failures{0};
    std::atomic<std::size_t> refreshes{0};
    std::atomic<std::size_t> refresh_failures{0};
    std::atomic<std::size_t> evictions{0};

    static void bump(std::atomic<std::size_t>& counter,
                     std::size_t by = 1) noexcept {
        counter.fetch_add(by, std::memory_order_relaxed);
    }

    [[nodiscard]] CacheStatistics snapshot(std::size_t size) const noexcept {
        CacheStatistics stats;
        stats.hits = hits.load(std::memory_order_relaxed);
        stats.misses = misses.load(std::memory_order_relaxed);
        stats.loads = loads.load(std::memory_order_relaxed);
        stats.load_failures = load_failures.load(std::memory_order_relaxed);
        stats.refreshes = refreshes.load(std::memory_order_relaxed);
        stats.refresh_failures =
            refresh_failures.load(std::memory_order_relaxed);
        stats.evictions = evictions.load(std::memory_order_relaxed);
        stats.size = size;
        return stats;
    }
};

/**
 * @brief Encodes a time point as a single word; zero means "never".
 */
[[nodiscard]] inline Clock::rep toTicks(TimePoint time) noexcept {
    return time.time_since_epoch().count();
}

[[nodiscard]] inline TimePoint fromTicks(Clock::rep ticks) noexcept {
    return TimePoint(Clock::duration(ticks));
}

}  // namespace detail

}  // namespace recache::cache

#endif  // RECACHE_CACHE_COMMON_HPP
