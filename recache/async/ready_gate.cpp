/*
 * ready_gate.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "ready_gate.hpp"

namespace recache::async {

bool ReadyGate::open() noexcept {
    bool expected = false;
    {
        std::lock_guard lock(mutex_);
        if (!open_.compare_exchange_strong(expected, true,
                                           std::memory_order_acq_rel)) {
            return false;
        }
    }
    cv_.notify_all();
    return true;
}

bool ReadyGate::wait(const Context& ctx) const {
    if (isOpen()) {
        return true;
    }
    std::unique_lock lock(mutex_);
    return ctx.wait(lock, cv_, [this] {
        return open_.load(std::memory_order_acquire);
    });
}

void ReadyGate::wait() const {
    if (isOpen()) {
        return;
    }
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return open_.load(std::memory_order_acquire); });
}

}  // namespace recache::async
