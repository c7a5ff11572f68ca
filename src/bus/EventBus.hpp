#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "model/LatencyEvent.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// Bounded fan-out channel: many Samplers publish, each subscriber gets its
// own bounded FIFO and its own copy of every accepted event.
//
// BACKPRESSURE: publish() never blocks. If ANY subscriber queue is at
//   capacity the event is dropped for all of them (drop-newest) and
//   dropped() is incremented once. Subscribers therefore always observe the
//   same stream, and dropped() == number of rejected publish attempts.
//
// ORDERING: FIFO per producer. No order across producers.
//
// Subscribe before producers start; a late subscriber only sees events
// published after it joined.
// ---------------------------------------------------------------------------
class EventBus {
    struct Shared;

    // Only EventBus can mint one; keeps Subscription construction private
    // while still allowing make_shared.
    struct Key {
        explicit Key() = default;
    };

public:
    enum class PopStatus { ITEM, TIMEOUT, CLOSED };

    class Subscription {
    public:
        Subscription(Key, std::shared_ptr<Shared> shared, std::size_t index, std::string name);

        // Blocks up to `timeout` for the next event. CLOSED only once the
        // bus is closed AND this queue is empty.
        PopStatus pop(std::optional<LatencyEvent>& out, std::chrono::milliseconds timeout);

        // Non-blocking: moves up to `max` queued events into `out`.
        std::size_t drain(std::vector<LatencyEvent>& out, std::size_t max);

        std::size_t depth() const;
        const std::string& name() const { return name_; }

    private:
        std::shared_ptr<Shared> shared_;
        std::size_t index_;
        std::string name_;
    };

    explicit EventBus(std::size_t capacity);

    std::shared_ptr<Subscription> subscribe(const std::string& name);

    // false when the event was dropped (full or closed).
    bool publish(const LatencyEvent& event);

    // Stop admission; subscribers drain what is already queued.
    void close();

    // Stop admission and throw away everything queued.
    void close_and_discard();

    bool        closed()    const;
    std::size_t capacity()  const { return capacity_; }
    uint64_t    published() const { return published_.load(std::memory_order_relaxed); }
    uint64_t    dropped()   const { return dropped_.load(std::memory_order_relaxed); }
    uint64_t    rejected_closed() const { return rejected_closed_.load(std::memory_order_relaxed); }

private:
    std::size_t capacity_;
    std::shared_ptr<Shared> shared_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> rejected_closed_{0};
};

using EventSubscription = EventBus::Subscription;

} // namespace latmon
