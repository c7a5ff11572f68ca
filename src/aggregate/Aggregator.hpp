#pragma once
#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "aggregate/RollingWindow.hpp"
#include "bus/EventBus.hpp"
#include "model/Snapshot.hpp"
#include "runtime/Cancellation.hpp"

namespace latmon {

struct AggregatorConfig {
    std::vector<int64_t> bounds_us = LatencyHistogram::default_bounds();
    std::size_t slices{60};
    Micros      slice_width{std::chrono::seconds(60)};
};

// ---------------------------------------------------------------------------
// Online per-class latency statistics over a rolling window.
//
// One RollingWindow per component class, each behind its own shared_mutex:
// record() takes the class's write lock, snapshot() its read lock. Classes
// never contend with each other. Once record() returns, every later
// snapshot of that class includes the event (until it ages out).
//
// Fed by its own consumer thread from an EventBus subscription; record()
// may also be called directly.
// ---------------------------------------------------------------------------
class Aggregator {
public:
    explicit Aggregator(AggregatorConfig cfg = AggregatorConfig{});
    ~Aggregator();

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    // false when the event is older than the window.
    bool record(const LatencyEvent& event);

    PerformanceSnapshot snapshot(ComponentClass c, Timestamp now) const;
    PerformanceSnapshot snapshot(ComponentClass c) const { return snapshot(c, wall_now()); }

    // Classes with at least one event in the window.
    std::vector<PerformanceSnapshot> snapshot_all(Timestamp now) const;
    std::vector<PerformanceSnapshot> snapshot_all() const { return snapshot_all(wall_now()); }

    // Consumer loop. Exits when the bus is closed and drained, or at once
    // on a forced cancel.
    void start(std::shared_ptr<EventSubscription> sub, CancellationToken token);
    void join();

    bool        running()    const { return running_.load(); }
    uint64_t    recorded()   const { return recorded_.load(std::memory_order_relaxed); }
    uint64_t    too_old()    const { return too_old_.load(std::memory_order_relaxed); }
    std::size_t cell_count() const;
    const AggregatorConfig& config() const { return cfg_; }

private:
    struct ClassWindow {
        mutable std::shared_mutex mtx;
        RollingWindow window;
        std::optional<Timestamp> last_updated;
        explicit ClassWindow(const AggregatorConfig& c)
            : window(c.bounds_us, c.slices, c.slice_width) {}
    };

    void run(std::shared_ptr<EventSubscription> sub, CancellationToken token);

    AggregatorConfig cfg_;
    std::array<std::unique_ptr<ClassWindow>, kComponentClassCount> classes_;

    std::atomic<bool>     running_{false};
    std::thread           worker_;
    std::atomic<uint64_t> recorded_{0};
    std::atomic<uint64_t> too_old_{0};
};

} // namespace latmon
