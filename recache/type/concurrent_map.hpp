/*
 * concurrent_map.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RECACHE_TYPE_CONCURRENT_MAP_HPP
#define RECACHE_TYPE_CONCURRENT_MAP_HPP

#include <cstddef>        // For std::size_t
#include <functional>     // For std::hash, std::equal_to
#include <mutex>          // For std::unique_lock
#include <optional>       // For std::optional
#include <shared_mutex>   // For std::shared_mutex, std::shared_lock
#include <stdexcept>      // For std::runtime_error
#include <string>         // For std::string
#include <unordered_map>  // For std::unordered_map
#include <utility>        // For std::pair, std::move
#include <vector>         // For std::vector

namespace recache::type {

/**
 * @brief Exception class for concurrent_map operations
 */
class concurrent_map_error : public std::runtime_error {
public:
    explicit concurrent_map_error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A thread-safe hash map split into independently locked shards.
 *
 * Every operation locks exactly one shard, except the whole-map operations
 * (size, snapshot, for_each, clear) which visit the shards one at a time.
 * Whole-map operations therefore see each shard consistently but not the map
 * as a single instant; that is enough for sweeps that tolerate concurrent
 * inserts and deletes.
 *
 * Values are copied out under the shard lock. Store cheap handles (such as
 * std::shared_ptr) when the payload is large.
 *
 * @tparam Key The type of the keys in the map.
 * @tparam T The type of the values in the map.
 * @tparam Hash Hash function for keys.
 * @tparam KeyEqual Key equality predicate.
 */
template <typename Key, typename T, typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class concurrent_map {
public:
    using key_type = Key;
    using mapped_type = T;
    using value_type = std::pair<Key, T>;
    using result_type = std::optional<T>;

    static constexpr std::size_t DEFAULT_SHARD_COUNT = 16;

    /**
     * @brief Constructs a concurrent_map with the given number of shards.
     *
     * @param shard_count Number of independently locked shards.
     * @throws std::invalid_argument if shard_count is 0.
     */
    explicit concurrent_map(std::size_t shard_count = DEFAULT_SHARD_COUNT)
        : shards_(shard_count) {
        if (shard_count == 0) {
            throw std::invalid_argument(
                "Number of shards must be greater than 0");
        }
    }

    concurrent_map(const concurrent_map&) = delete;
    concurrent_map& operator=(const concurrent_map&) = delete;

    /**
     * @brief Returns the value for a key, inserting one built by the factory
     * if the key is absent.
     *
     * The lookup and the insertion happen under the same exclusive shard
     * lock, so among any number of concurrent callers exactly one observes
     * `existed == false` for a given absent key. The factory runs under that
     * lock and must not call back into the map.
     *
     * @param key The key to look up or insert.
     * @param factory Callable returning a T, invoked only when inserting.
     * @return The stored value and whether it was already present.
     * @throws concurrent_map_error if the insertion fails.
     */
    template <typename Factory>
    std::pair<T, bool> get_or_insert(const Key& key, Factory&& factory) {
        auto& shard = shard_for(key);
        {
            std::shared_lock lock(shard.mtx);
            auto it = shard.data.find(key);
            if (it != shard.data.end()) {
                return {it->second, true};
            }
        }

        try {
            std::unique_lock lock(shard.mtx);
            auto it = shard.data.find(key);
            if (it != shard.data.end()) {
                return {it->second, true};
            }
            auto inserted = shard.data.emplace(key, factory()).first;
            return {inserted->second, false};
        } catch (const std::exception& e) {
            throw concurrent_map_error(
                std::string("Get or insert operation failed: ") + e.what());
        }
    }

    /**
     * @brief Finds an element in the map.
     *
     * @param key The key to find.
     * @return An optional containing a copy of the value if found.
     */
    [[nodiscard]] result_type find(const Key& key) const {
        const auto& shard = shard_for(key);
        std::shared_lock lock(shard.mtx);
        auto it = shard.data.find(key);
        if (it == shard.data.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains(const Key& key) const {
        const auto& shard = shard_for(key);
        std::shared_lock lock(shard.mtx);
        return shard.data.find(key) != shard.data.end();
    }

    /**
     * @brief Inserts or overwrites an element.
     *
     * @throws concurrent_map_error if the insertion fails.
     */
    void insert(const Key& key, T value) {
        auto& shard = shard_for(key);
        try {
            std::unique_lock lock(shard.mtx);
            shard.data.insert_or_assign(key, std::move(value));
        } catch (const std::exception& e) {
            throw concurrent_map_error(
                std::string("Insert operation failed: ") + e.what());
        }
    }

    /**
     * @brief Replaces the value for a key only if it still equals `expected`.
     *
     * @param key The key to update.
     * @param expected The value the caller last observed.
     * @param desired The replacement value.
     * @return true if the value was replaced, false if the key is absent or
     * holds a different value.
     */
    bool compare_exchange(const Key& key, const T& expected, T desired) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mtx);
        auto it = shard.data.find(key);
        if (it == shard.data.end() || !(it->second == expected)) {
            return false;
        }
        it->second = std::move(desired);
        return true;
    }

    /**
     * @brief Removes a key.
     *
     * @return true if the key was present.
     */
    bool erase(const Key& key) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mtx);
        return shard.data.erase(key) > 0;
    }

    /**
     * @brief Removes a key only if it still maps to `expected`.
     */
    bool erase_if_equal(const Key& key, const T& expected) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mtx);
        auto it = shard.data.find(key);
        if (it == shard.data.end() || !(it->second == expected)) {
            return false;
        }
        shard.data.erase(it);
        return true;
    }

    /**
     * @brief Performs a batch erase operation.
     *
     * @param keys The keys to erase.
     * @return The number of keys actually removed.
     */
    std::size_t batch_erase(const std::vector<Key>& keys) {
        std::size_t erased = 0;
        for (const auto& key : keys) {
            auto& shard = shard_for(key);
            std::unique_lock lock(shard.mtx);
            erased += shard.data.erase(key);
        }
        return erased;
    }

    /**
     * @brief Batch form of erase_if_equal.
     *
     * Keys whose value changed since the caller observed it are left alone.
     *
     * @return The number of keys actually removed.
     */
    std::size_t batch_erase_if_equal(const std::vector<value_type>& entries) {
        std::size_t erased = 0;
        for (const auto& [key, expected] : entries) {
            if (erase_if_equal(key, expected)) {
                ++erased;
            }
        }
        return erased;
    }

    /**
     * @brief Copies every key/value pair out of the map.
     *
     * Safe to call while other threads insert and erase; the result reflects
     * each shard at the moment it was visited.
     */
    [[nodiscard]] std::vector<value_type> snapshot() const {
        std::vector<value_type> result;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mtx);
            result.reserve(result.size() + shard.data.size());
            for (const auto& [key, value] : shard.data) {
                result.emplace_back(key, value);
            }
        }
        return result;
    }

    /**
     * @brief Visits a snapshot of the map without holding any lock.
     *
     * The callable receives (const Key&, const T&) and returns false to stop
     * the iteration early. It may freely call back into the map.
     */
    template <typename Func>
    void for_each(Func&& func) const {
        for (const auto& [key, value] : snapshot()) {
            if (!func(key, value)) {
                break;
            }
        }
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mtx);
            total += shard.data.size();
        }
        return total;
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /**
     * @brief Clears all elements from the map.
     */
    void clear() noexcept {
        for (auto& shard : shards_) {
            std::unique_lock lock(shard.mtx);
            shard.data.clear();
        }
    }

    [[nodiscard]] std::size_t shard_count() const noexcept {
        return shards_.size();
    }

private:
    struct Shard {
        mutable std::shared_mutex mtx;
        std::unordered_map<Key, T, Hash, KeyEqual> data;
    };

    [[nodiscard]] Shard& shard_for(const Key& key) {
        return shards_[hasher_(key) % shards_.size()];
    }

    [[nodiscard]] const Shard& shard_for(const Key& key) const {
        return shards_[hasher_(key) % shards_.size()];
    }

    std::vector<Shard> shards_;  ///< Shards, fixed at construction.
    Hash hasher_;                ///< Shard selector.
};

}  // namespace recache::type

#endif  // RECACHE_TYPE_CONCURRENT_MAP_HPP
