/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Cancellation context carried by cache reads and producers

**************************************************/

#ifndef RECACHE_ASYNC_CONTEXT_HPP
#define RECACHE_ASYNC_CONTEXT_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <utility>

namespace recache::async {

/**
 * @brief Why a Context stopped being usable.
 */
enum class ContextState {
    Active,            ///< Neither cancelled nor past its deadline.
    Cancelled,         ///< Stop was requested on the token.
    DeadlineExceeded,  ///< The deadline has passed.
};

[[nodiscard]] std::string_view toString(ContextState state) noexcept;

/**
 * @brief A cancellable, optionally deadline-bound execution context.
 *
 * A Context pairs a std::stop_token with an optional absolute deadline. It is
 * cheap to copy; copies observe the same stop state. A default-constructed
 * Context is never done.
 *
 * Blocking operations in this library accept a Context and return early once
 * it is done. Producers receive one and are expected to poll done() or wait
 * through it when they block.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    Context() noexcept = default;

    explicit Context(std::stop_token token,
                     std::optional<TimePoint> deadline = std::nullopt) noexcept;

    /**
     * @brief Derives a context that also ends `timeout` from now.
     *
     * The child keeps this context's stop token and the earlier of the two
     * deadlines.
     */
    template <typename Rep, typename Period>
    [[nodiscard]] Context withTimeout(
        std::chrono::duration<Rep, Period> timeout) const {
        return withDeadline(
            Clock::now() +
            std::chrono::duration_cast<Clock::duration>(timeout));
    }

    [[nodiscard]] Context withDeadline(TimePoint deadline) const;

    [[nodiscard]] bool cancelled() const noexcept;
    [[nodiscard]] bool expired() const noexcept;
    [[nodiscard]] bool done() const noexcept;
    [[nodiscard]] ContextState state() const noexcept;

    [[nodiscard]] const std::stop_token& stopToken() const noexcept {
        return token_;
    }

    [[nodiscard]] std::optional<TimePoint> deadline() const noexcept {
        return deadline_;
    }

    /**
     * @brief Waits on a condition variable until the predicate holds or the
     * context is done.
     *
     * @return The final value of the predicate.
     */
    template <typename Lock, typename Predicate>
    bool wait(Lock& lock, std::condition_variable_any& cv,
              Predicate pred) const {
        if (deadline_) {
            return cv.wait_until(lock, token_, *deadline_, std::move(pred));
        }
        return cv.wait(lock, token_, std::move(pred));
    }

    /**
     * @brief Sleeps for the given duration or until the context is done.
     *
     * @return true if the full duration elapsed, false if the context ended
     * the sleep early.
     */
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) const {
        return sleepUntil(
            Clock::now() +
            std::chrono::duration_cast<Clock::duration>(duration));
    }

    bool sleepUntil(TimePoint wakeup) const;

private:
    std::stop_token token_;
    std::optional<TimePoint> deadline_;
};

}  // namespace recache::async

#endif  // RECACHE_ASYNC_CONTEXT_HPP
