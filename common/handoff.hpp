#pragma once

// ============================================================
// handoff.hpp -- Capacity-one producer/consumer rendezvous
//
// At most one produced-but-unconsumed item exists at any time:
// publish() blocks until the slot is empty. End of stream is an
// explicit flag (close()), never a sentinel value in the slot, so
// an empty payload stays distinguishable from "no more items".
// ============================================================

#include <mutex>
#include <condition_variable>
#include <optional>
#include <utility>

template<typename T>
class Handoff {
public:
    Handoff() = default;

    // Non-copyable, non-movable
    Handoff(const Handoff&) = delete;
    Handoff& operator=(const Handoff&) = delete;

    // Producer: wait for the slot to empty, then place item.
    // Returns false (item dropped) if the consumer cancelled or the
    // stream was already closed.
    bool publish(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !slot_.has_value() || cancelled_ || closed_; });
        if (cancelled_ || closed_) return false;
        slot_.emplace(std::move(item));
        cv_.notify_all();
        return true;
    }

    // Producer: no more items. A pending item is still delivered.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    // Consumer: wait for an item; std::nullopt means end of stream
    std::optional<T> take() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return slot_.has_value() || closed_ || cancelled_; });
        if (cancelled_ || !slot_.has_value()) return std::nullopt;
        std::optional<T> out(std::move(slot_));
        slot_.reset();
        cv_.notify_all();
        return out;
    }

    // Consumer side abort: releases a blocked producer and drops any pending item
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        slot_.reset();
        cv_.notify_all();
    }

    bool pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slot_.has_value();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ || cancelled_;
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::optional<T>        slot_;
    bool                    closed_{false};
    bool                    cancelled_{false};
};
