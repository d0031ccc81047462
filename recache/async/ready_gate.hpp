/*
 * ready_gate.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: One-shot broadcast signal with cancellable waits

**************************************************/

#ifndef RECACHE_ASYNC_READY_GATE_HPP
#define RECACHE_ASYNC_READY_GATE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "recache/async/context.hpp"

namespace recache::async {

/**
 * @brief A gate that opens exactly once and never closes again.
 *
 * Any number of threads may wait for the gate; opening it releases all of
 * them. Opening an already open gate is a no-op.
 */
class ReadyGate {
public:
    ReadyGate() = default;
    ReadyGate(const ReadyGate&) = delete;
    ReadyGate& operator=(const ReadyGate&) = delete;

    /**
     * @brief Opens the gate and wakes every waiter.
     *
     * @return true if this call opened the gate, false if it was already open.
     */
    bool open() noexcept;

    [[nodiscard]] bool isOpen() const noexcept {
        return open_.load(std::memory_order_acquire);
    }

    /**
     * @brief Blocks until the gate opens or the context is done.
     *
     * @return true if the gate is open.
     */
    bool wait(const Context& ctx) const;

    /**
     * @brief Blocks until the gate opens.
     */
    void wait() const;

    /**
     * @brief Opens a gate when it goes out of scope.
     *
     * Guarantees the owner of a pending computation releases its waiters on
     * every exit path, exceptions included.
     */
    class Opener {
    public:
        explicit Opener(ReadyGate& gate) noexcept : gate_(&gate) {}
        ~Opener() noexcept {
            if (gate_ != nullptr) {
                gate_->open();
            }
        }

        Opener(const Opener&) = delete;
        Opener& operator=(const Opener&) = delete;

        /**
         * @brief Opens the gate now instead of at scope exit.
         */
        void release() noexcept {
            if (gate_ != nullptr) {
                gate_->open();
                gate_ = nullptr;
            }
        }

    private:
        ReadyGate* gate_;
    };

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;
    std::atomic<bool> open_{false};
};

}  // namespace recache::async

#endif  // RECACHE_ASYNC_READY_GATE_HPP
