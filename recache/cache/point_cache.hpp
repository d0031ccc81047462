/*
 * point_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file point_cache.hpp
 * @brief Per-key lazily loaded cache with proactive background refresh
 */

#ifndef RECACHE_CACHE_POINT_CACHE_HPP
#define RECACHE_CACHE_POINT_CACHE_HPP

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
 * @brief A cache that computes each key on first use and keeps hot keys
 * fresh in the background.
 *
 * The first get() for a key calls the producer on the caller's thread. Any
 * other caller asking for the same key meanwhile waits for that single
 * computation instead of starting its own. Once loaded, an entry is served
 * without blocking.
 *
 * A maintenance thread wakes every refresh_interval / 4 and walks all
 * entries:
 *   - slots whose first computation is still running are left alone;
 *   - entries older than keep_time (if keep_time > 0) are evicted;
 *   - entries younger than refresh_interval are left alone;
 *   - entries not read since they were last computed are left alone;
 *   - stale entries read within the last refresh_interval / 2 are recomputed
 *     in place, with a deadline of refresh_interval / 2; a failed recompute
 *     keeps the stale value;
 *   - everything else is left to age out.
 *
 * Entries are immutable once published and are replaced as a whole, so a
 * reader never sees a value paired with another generation's timestamps.
 *
 * close() must be called (the destructor does it) to stop the maintenance
 * thread and release the entries. It must not be called from a producer.
 *
 * @tparam Key The type of the cache keys (must be hashable).
 * @tparam Value The type of the cached values.
 * @tparam Hash The hash function type for keys.
 * @tparam KeyEqual The key equality comparison type.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class PointCache {
public:
    /**
     * @brief Computes the value for a key; nullopt reports failure.
     *
     * The context carries the caller's cancellation on first loads and the
     * cache lifetime plus a refresh deadline on background refreshes.
     */
    using Producer =
        std::function<std::optional<Value>(const Key&, const async::Context&)>;

    /**
     * @brief Constructs a PointCache and starts its maintenance thread.
     *
     * @param refresh_interval Age after which a recently read entry is
     * recomputed in the background.
     * @param keep_time Age after which an entry is evicted; zero never evicts.
     * @param producer Function computing values.
     * @throws CacheConfigException on invalid settings or an empty producer.
     */
    PointCache(Duration refresh_interval, Duration keep_time,
               Producer producer)
        : PointCache(CacheOptions{refresh_interval, keep_time},
                     std::move(producer)) {}

    /**
     * @brief Constructs a PointCache from a full set of options.
     *
     * @throws CacheConfigException on invalid settings or an empty producer.
     */
    PointCache(CacheOptions options, Producer producer)
        : options_(validated(std::move(options))),
          producer_(std::move(producer)),
          map_(options_.shard_count) {
        if (!producer_) {
            throw CacheConfigException("PointCache requires a producer");
        }
        maintenance_ = std::jthread(
            [this](std::stop_token stop) { maintenanceLoop(stop); });
        spdlog::info("PointCache[{}]: started (refresh {}ms, keep {}ms)",
                     options_.name, options_.refresh_interval.count(),
                     options_.keep_time.count());
    }

    ~PointCache() noexcept { close(); }

    PointCache(const PointCache&) = delete;
    PointCache& operator=(const PointCache&) = delete;
    PointCache(PointCache&&) = delete;
    PointCache& operator=(PointCache&&) = delete;

    /**
     * @brief Returns the value for a key, computing it on first use.
     *
     * If another caller is already computing the key, waits for that
     * computation until the context is done. Giving up never cancels the
     * computation itself.
     *
     * A key whose first computation failed keeps reporting nullopt until it is
     * set(), removed or evicted.
     *
     * @param key The key to look up.
     * @param ctx Bounds how long this call may wait; also handed to the
     * producer when this call performs the first computation.
     * @return The value, or nullopt if it is unavailable.
     * @throws Whatever the producer throws, when this call runs it.
     */
    [[nodiscard]] std::optional<Value> get(const Key& key,
                                           const async::Context& ctx = {}) {
        if (closed()) {
            spdlog::debug("PointCache[{}]: get after close", options_.name);
            StatisticsCounters::bump(stats_.misses);
            return std::nullopt;
        }

        auto [entry, existed] =
            map_.get_or_insert(key, [] { return Entry::placeholder(); });
        if (!existed) {
            return loadNew(key, entry, ctx);
        }

        if (entry->pending()) {
            if (!entry->ready->wait(ctx)) {
                StatisticsCounters::bump(stats_.misses);
                return std::nullopt;
            }
            // The computing thread has republished the slot by now.
            auto current = map_.find(key);
            if (!current || (*current)->pending()) {
                StatisticsCounters::bump(stats_.misses);
                return std::nullopt;
            }
            entry = std::move(*current);
        }

        entry->touch(Clock::now());
        StatisticsCounters::bump(stats_.hits);
        return entry->value;
    }

    /**
     * @brief Stores a value directly, replacing whatever the key held.
     *
     * The entry counts as freshly computed and recently read. Callers
     * already waiting on a pending first computation of the same key see this
     * value once that computation finishes; the computation's own result is
     * then discarded.
     */
    void set(const Key& key, Value value) {
        if (closed()) {
            spdlog::debug("PointCache[{}]: set after close ignored",
                          options_.name);
            return;
        }
        const auto now = Clock::now();
        map_.insert(key, std::make_shared<Entry>(std::move(value), now,
                                                 detail::toTicks(now),
                                                 nullptr));
    }

    /**
     * @brief Drops a key; the next get() computes it again.
     *
     * @return true if the key was present.
     */
    bool remove(const Key& key) { return map_.erase(key); }

    /**
     * @brief Checks whether a key holds a successfully loaded value.
     */
    [[nodiscard]] bool contains(const Key& key) const {
        auto entry = map_.find(key);
        return entry && !(*entry)->pending();
    }

    /**
     * @brief Runs one maintenance pass on the calling thread.
     */
    void sweep() {
        if (closed()) {
            return;
        }
        sweepOnce(async::Context{});
    }

    /**
     * @brief Stops the maintenance thread and releases all entries.
     *
     * Idempotent. Later get() calls return nullopt and set() is ignored.
     */
    void close() noexcept {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        maintenance_.request_stop();
        if (maintenance_.joinable()) {
            maintenance_.join();
        }
        const auto released = map_.size();
        map_.clear();
        spdlog::info("PointCache[{}]: closed, released {} entries",
                     options_.name, released);
    }

    [[nodiscard]] bool closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    /**
     * @brief Number of slots, including pending and failed ones.
     */
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
        std::optional<Value> value;
        TimePoint created_at;
        std::atomic<Clock::rep> last_used;  ///< 0 until first successful read
        /// Set only while the slot awaits its first computation.
        std::shared_ptr<async::ReadyGate> ready;

        Entry(std::optional<Value> v, TimePoint created, Clock::rep used,
              std::shared_ptr<async::ReadyGate> gate)
            : value(std::move(v)),
              created_at(created),
              last_used(used),
              ready(std::move(gate)) {}

        static std::shared_ptr<Entry> placeholder() {
            return std::make_shared<Entry>(
                std::nullopt, Clock::now(), 0,
                std::make_shared<async::ReadyGate>());
        }

        [[nodiscard]] bool pending() const noexcept {
            return ready != nullptr;
        }

        [[nodiscard]] TimePoint lastUsed() const noexcept {
            return detail::fromTicks(
                last_used.load(std::memory_order_acquire));
        }

        void touch(TimePoint now) noexcept {
            last_used.store(detail::toTicks(now), std::memory_order_release);
        }
    };

    using EntryPtr = std::shared_ptr<Entry>;

    enum class SweepAction { Keep, Evict, Refresh };

    static CacheOptions validated(CacheOptions options) {
        options.validate();
        return options;
    }

    std::optional<Value> loadNew(const Key& key, const EntryPtr& placeholder,
                                 const async::Context& ctx) {
        async::ReadyGate::Opener opener(*placeholder->ready);
        StatisticsCounters::bump(stats_.loads);
        StatisticsCounters::bump(stats_.misses);

        std::optional<Value> data;
        try {
            data = producer_(key, ctx);
        } catch (...) {
            StatisticsCounters::bump(stats_.load_failures);
            throw;
        }
        if (!data) {
            StatisticsCounters::bump(stats_.load_failures);
            return std::nullopt;
        }

        const auto now = Clock::now();
        // Loses to a concurrent set() or remove(); the caller still gets its
        // value.
        map_.compare_exchange(
            key, placeholder,
            std::make_shared<Entry>(data, now, detail::toTicks(now), nullptr));
        return data;
    }

    [[nodiscard]] SweepAction classify(const Entry& entry,
                                       TimePoint now) const noexcept {
        // A first load still in flight owns its slot until it publishes.
        if (entry.pending() && !entry.ready->isOpen()) {
            return SweepAction::Keep;
        }
        const auto age = now - entry.created_at;
        if (options_.keep_time > Duration::zero() && age > options_.keep_time) {
            return SweepAction::Evict;
        }
        if (age < options_.refresh_interval) {
            return SweepAction::Keep;
        }
        const auto last_used = entry.lastUsed();
        if (entry.created_at > last_used) {
            return SweepAction::Keep;
        }
        if (now - last_used < halfInterval()) {
            return SweepAction::Refresh;
        }
        return SweepAction::Keep;
    }

    bool refreshEntry(const Key& key, const EntryPtr& entry,
                      const async::Context& ctx) {
        StatisticsCounters::bump(stats_.refreshes);
        std::optional<Value> data;
        try {
            data = producer_(key, ctx.withTimeout(halfInterval()));
        } catch (const std::exception& e) {
            spdlog::error("PointCache[{}]: producer threw during refresh: {}",
                          options_.name, e.what());
        } catch (...) {
            spdlog::error(
                "PointCache[{}]: producer threw an unknown exception during "
                "refresh",
                options_.name);
        }
        if (!data) {
            StatisticsCounters::bump(stats_.refresh_failures);
            return false;
        }

        auto refreshed = std::make_shared<Entry>(
            std::move(data), Clock::now(),
            entry->last_used.load(std::memory_order_acquire), nullptr);
        map_.compare_exchange(key, entry, std::move(refreshed));
        return true;
    }

    void sweepOnce(const async::Context& ctx) {
        std::vector<std::pair<Key, EntryPtr>> expired;
        std::size_t refreshed = 0;
        std::size_t failed = 0;

        map_.for_each([&](const Key& key, const EntryPtr& entry) {
            if (ctx.done()) {
                return false;
            }
            switch (classify(*entry, Clock::now())) {
                case SweepAction::Evict:
                    expired.emplace_back(key, entry);
                    break;
                case SweepAction::Refresh:
                    if (refreshEntry(key, entry, ctx)) {
                        ++refreshed;
                    } else {
                        ++failed;
                    }
                    break;
                case SweepAction::Keep:
                    break;
            }
            return true;
        });

        const auto evicted = map_.batch_erase_if_equal(expired);
        StatisticsCounters::bump(stats_.evictions, evicted);

        if (refreshed + failed + evicted > 0) {
            spdlog::debug(
                "PointCache[{}]: sweep refreshed {}, failed {}, evicted {}",
                options_.name, refreshed, failed, evicted);
        }
    }

    void maintenanceLoop(std::stop_token stop) {
        const async::Context lifecycle(stop);
        const auto interval =
            std::chrono::duration_cast<Clock::duration>(
                options_.refresh_interval) /
            4;
        while (lifecycle.sleepFor(interval)) {
            sweepOnce(lifecycle);
        }
        spdlog::debug("PointCache[{}]: maintenance stopped", options_.name);
    }

    [[nodiscard]] Clock::duration halfInterval() const noexcept {
        return std::chrono::duration_cast<Clock::duration>(
                   options_.refresh_interval) /
               2;
    }

    CacheOptions options_;
    Producer producer_;
    type::concurrent_map<Key, EntryPtr, Hash, KeyEqual> map_;
    StatisticsCounters stats_;
    std::atomic<bool> closed_{false};
    std::jthread maintenance_;  ///< Started last, stopped first.
};

}  // namespace recache::cache

#endif  // RECACHE_CACHE_POINT_CACHE_HPP
