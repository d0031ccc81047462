/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "context.hpp"

#include <algorithm>
#include <utility>

namespace recache::async {

std::string_view toString(ContextState state) noexcept {
    switch (state) {
        case ContextState::Active:
            return "active";
        case ContextState::Cancelled:
            return "cancelled";
        case ContextState::DeadlineExceeded:
            return "deadline exceeded";
    }
    return "unknown";
}

Context::Context(std::stop_token token,
                 std::optional<TimePoint> deadline) noexcept
    : token_(std::move(token)), deadline_(deadline) {}

Context Context::withDeadline(TimePoint deadline) const {
    Context child = *this;
    child.deadline_ = deadline_ ? std::min(*deadline_, deadline) : deadline;
    return child;
}

bool Context::cancelled() const noexcept { return token_.stop_requested(); }

bool Context::expired() const noexcept {
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

bool Context::done() const noexcept { return cancelled() || expired(); }

ContextState Context::state() const noexcept {
    if (cancelled()) {
        return ContextState::Cancelled;
    }
    if (expired()) {
        return ContextState::DeadlineExceeded;
    }
    return ContextState::Active;
}

bool Context::sleepUntil(TimePoint wakeup) const {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    const TimePoint until =
        deadline_ ? std::min(*deadline_, wakeup) : wakeup;
    // Nothing notifies cv; only the stop token or the timeout can end the
    // wait.
    cv.wait_until(lock, token_, until, [] { return false; });
    return !token_.stop_requested() && Clock::now() >= wakeup;
}

}  // namespace recache::async
