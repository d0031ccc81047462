/*
 * bulk_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file bulk_cache.hpp
 * @brief Cache filled many keys at a time by a periodically re-run producer
 */

#ifndef RECACHE_CACHE_BULK_CACHE_HPP
#define RECACHE_CACHE_BULK_CACHE_HPP

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "recache/async/context.hpp"
#include "recache/async/ready_gate.hpp"
#include "recache/cache/common.hpp"
#include "recache/type/concurrent_map.hpp"

namespace recache::cache {

/**
 * @brief A cache whose whole content comes from one producer that writes
 * many keys per run.
 *
 * The maintenance thread runs the producer once at start-up, then every
 * refresh_interval (checked every refresh_interval / 4 + refresh_interval /
 * 16). Readers block until the first successful run has finished and then
 * read whatever the runs have written so far.
 *
 * Runs merge into the existing content: a key the latest run did not write
 * keeps its previous value until it is older than keep_time. Readers can
 * therefore see values from several producer runs at once. Producers that
 * need replace semantics must write every key on every run and rely on
 * keep_time to drop the rest.
 *
 * close() must be called (the destructor does it) to stop the maintenance
 * thread and release the entries. It must not be called from the producer.
 *
 * @tparam Key The type of the cache keys (must be hashable).
 * @tparam Value The type of the cached values.
 * @tparam Hash The hash function type for keys.
 * @tparam KeyEqual The key equality comparison type.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class BulkCache {
public:
    /// Stores one key/value pair; callable any number of times per run.
    using Setter = std::function<void(const Key&, Value)>;
    /// Fills the cache through the setter; returns false if the run failed.
    using Producer =
        std::function<bool(const async::Context&, const Setter&)>;

    /**
     * @brief Constructs a BulkCache and starts its maintenance thread.
     *
     * Does not wait for the first producer run.
     *
     * @param refresh_interval Time between producer runs.
     * @param keep_time Age after which an entry is evicted; zero never evicts.
     * @param producer Function filling the cache.
     * @throws CacheConfigException on invalid settings or an empty producer.
     */
    BulkCache(Duration refresh_interval, Duration keep_time, Producer producer)
        : BulkCache(CacheOptions{refresh_interval, keep_time},
                    std::move(producer)) {}

    BulkCache(CacheOptions options, Producer producer)
        : options_(validated(std::move(options))),
          producer_(std::move(producer)),
          map_(options_.shard_count) {
        if (!producer_) {
            throw CacheConfigException("BulkCache requires a producer");
        }
        maintenance_ = std::jthread(
            [this](std::stop_token stop) { maintenanceLoop(stop); });
        spdlog::info("BulkCache[{}]: started (refresh {}ms, keep {}ms)",
                     options_.name, options_.refresh_interval.count(),
                     options_.keep_time.count());
    }

    ~BulkCache() noexcept { close(); }

    BulkCache(const BulkCache&) = delete;
    BulkCache& operator=(const BulkCache&) = delete;
    BulkCache(BulkCache&&) = delete;
    BulkCache& operator=(BulkCache&&) = delete;

    /**
     * @brief Looks up a key, first waiting for the initial population.
     *
     * @param key The key to look up.
     * @param ctx Bounds the wait for the initial population.
     * @return The value, or nullopt if the key is absent or the context ended
     * the wait.
     */
    [[nodiscard]] std::optional<Value> get(const Key& key,
                                           const async::Context& ctx = {}) {
        if (!ready_.wait(ctx) || closed()) {
            StatisticsCounters::bump(stats_.misses);
            return std::nullopt;
        }

        auto entry = map_.find(key);
        if (!entry) {
            StatisticsCounters::bump(stats_.misses);
            return std::nullopt;
        }
        StatisticsCounters::bump(stats_.hits);
        return (*entry)->value;
    }

    /**
     * @brief Waits until the first successful producer run has finished.
     *
     * @return true once the cache is populated; false if the context ended
     * the wait or the cache was closed before any run succeeded.
     */
    bool waitReady(const async::Context& ctx = {}) const {
        return ready_.wait(ctx) && lastRefresh().has_value();
    }

    /**
     * @brief Whether readers are no longer blocked.
     *
     * Also true after close(), which releases every waiter.
     */
    [[nodiscard]] bool ready() const noexcept { return ready_.isOpen(); }

    /**
     * @brief Start time of the last successful producer run.
     */
    [[nodiscard]] std::optional<TimePoint> lastRefresh() const noexcept {
        const auto ticks = last_refresh_.load(std::memory_order_acquire);
        if (ticks == 0) {
            return std::nullopt;
        }
        return detail::fromTicks(ticks);
    }

    /**
     * @brief Removes every entry older than keep_time.
     *
     * @return The number of entries removed.
     */
    std::size_t evictExpired() {
        if (options_.keep_time <= Duration::zero()) {
            return 0;
        }
        std::vector<std::pair<Key, EntryPtr>> expired;
        map_.for_each([&](const Key& key, const EntryPtr& entry) {
            if (Clock::now() - entry->created_at > options_.keep_time) {
                expired.emplace_back(key, entry);
            }
            return true;
        });
        const auto evicted = map_.batch_erase_if_equal(expired);
        StatisticsCounters::bump(stats_.evictions, evicted);
        if (evicted > 0) {
            spdlog::debug("BulkCache[{}]: evicted {} expired entries",
                          options_.name, evicted);
        }
        return evicted;
    }

    /**
     * @brief Stops the maintenance thread, releases blocked readers and drops
     * all entries.
     *
     * Idempotent. Later get() calls return nullopt.
     */
    void close() noexcept {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        maintenance_.request_stop();
        if (maintenance_.joinable()) {
            maintenance_.join();
        }
        ready_.open();
        const auto released = map_.size();
        map_.clear();
        spdlog::info("BulkCache[{}]: closed, released {} entries",
                     options_.name, released);
    }

    [[nodiscard]] bool closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    [[nodiscard]] CacheStatistics statistics() const noexcept {
        return stats_.snapshot(map_.size());
    }

    [[nodiscard]] Duration refreshInterval() const noexcept {
        return options_.refresh_interval;
    }

    [[nodiscard]] Duration keepTime() const noexcept {
        return options_.keep_time;
    }

    [[nodiscard]] const std::string& name() const noexcept {
        return options_.name;
    }

private:
    using StatisticsCounters = detail::StatisticsCounters;

    struct Entry {
        Value value;
        TimePoint created_at;
    };

    using EntryPtr = std::shared_ptr<const Entry>;

    static CacheOptions validated(CacheOptions options) {
        options.validate();
        return options;
    }

    /**
     * @brief Runs the producer once; on success records the run and opens
     * the gate.
     */
    bool runProducer(const async::Context& ctx) {
        const auto start = Clock::now();
        // The producer may call the setter from several threads.
        std::atomic<std::size_t> written{0};
        const Setter setter = [this, &written](const Key& key, Value value) {
            map_.insert(key, std::make_shared<const Entry>(
                                 Entry{std::move(value), Clock::now()}));
            written.fetch_add(1, std::memory_order_relaxed);
        };

        StatisticsCounters::bump(stats_.refreshes);
        bool ok = false;
        try {
            ok = producer_(ctx, setter);
        } catch (const std::exception& e) {
            spdlog::error("BulkCache[{}]: producer threw: {}", options_.name,
                          e.what());
        } catch (...) {
            spdlog::error("BulkCache[{}]: producer threw an unknown exception",
                          options_.name);
        }

        if (!ok || ctx.cancelled()) {
            StatisticsCounters::bump(stats_.refresh_failures);
            spdlog::debug("BulkCache[{}]: producer run failed after {} writes",
                          options_.name, written.load());
            return false;
        }

        last_refresh_.store(detail::toTicks(start), std::memory_order_release);
        if (ready_.open()) {
            spdlog::debug("BulkCache[{}]: initial population complete",
                          options_.name);
        }
        spdlog::debug("BulkCache[{}]: producer run wrote {} entries",
                      options_.name, written.load());
        return true;
    }

    void maintenanceLoop(std::stop_token stop) {
        const async::Context lifecycle(stop);
        // Readers must never stay blocked once maintenance is over.
        async::ReadyGate::Opener release_readers(ready_);

        runProducer(lifecycle);

        const auto refresh = std::chrono::duration_cast<Clock::duration>(
            options_.refresh_interval);
        while (lifecycle.sleepFor(refresh / 4) &&
               lifecycle.sleepFor(refresh / 16)) {
            evictExpired();

            const auto last = lastRefresh();
            if (last && Clock::now() - *last < refresh) {
                continue;
            }
            runProducer(lifecycle);
        }
        spdlog::debug("BulkCache[{}]: maintenance stopped", options_.name);
    }

    CacheOptions options_;
    Producer producer_;
    type::concurrent_map<Key, EntryPtr, Hash, KeyEqual> map_;
    async::ReadyGate ready_;
    StatisticsCounters stats_;
    std::atomic<Clock::rep> last_refresh_{0};
    std::atomic<bool> closed_{false};
    std::jthread maintenance_;  ///< Started last, stopped first.
};

}  // namespace recache::cache

#endif  // RECACHE_CACHE_BULK_CACHE_HPP
