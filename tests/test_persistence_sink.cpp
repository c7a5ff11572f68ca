#include <gtest/gtest.h>
#include <thread>

#include "probe/SyntheticLoad.hpp"
#include "storage/PersistenceSink.hpp"
#include "TestSupport.hpp"

using namespace latmon;
using namespace latmon::test;
using namespace std::chrono_literals;

namespace {

SinkConfig fast_retry() {
    SinkConfig cfg;
    cfg.batch_size      = 16;
    cfg.max_attempts    = 3;
    cfg.initial_backoff = 1ms;
    cfg.max_backoff     = 4ms;
    return cfg;
}

// Store whose appends fail with something other than StoreError.
class BrokenStore : public MemoryEventStore {
public:
    std::vector<int64_t> append(const std::vector<LatencyEvent>& batch) override {
        if (throws_.load()) throw std::logic_error("unexpected store state");
        return MemoryEventStore::append(batch);
    }
    void set_throwing(bool t) { throws_.store(t); }

private:
    std::atomic<bool> throws_{true};
};

} // namespace

TEST(PersistenceSink, RejectsBadConfiguration) {
    EXPECT_THROW(PersistenceSink(nullptr), std::invalid_argument);
    SinkConfig cfg;
    cfg.batch_size = 0;
    EXPECT_THROW(PersistenceSink(std::make_shared<MemoryEventStore>(), cfg), std::invalid_argument);
}

TEST(PersistenceSink, StoreReturnsPersistedCopy) {
    auto store = std::make_shared<MemoryEventStore>();
    PersistenceSink sink(store, fast_retry());

    auto ev = make_event(base_time(), ComponentClass::EDITOR, 12.0);
    auto saved = sink.store(ev);
    ASSERT_TRUE(saved.has_value());
    ASSERT_TRUE(saved->id().has_value());
    EXPECT_EQ(saved->timestamp(), ev.timestamp());
    EXPECT_EQ(saved->duration_us(), 12000);
    EXPECT_EQ(sink.total_events(), 1u);
}

TEST(PersistenceSink, TransientFailureIsRetried) {
    auto store = std::make_shared<MemoryEventStore>();
    store->fail_next_appends(2);
    PersistenceSink sink(store, fast_retry());

    auto saved = sink.store(make_event(base_time(), ComponentClass::EDITOR, 1.0));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(store->append_calls(), 3);

    auto s = sink.stats();
    EXPECT_EQ(s.write_failures, 2u);
    EXPECT_EQ(s.stored, 1u);
    EXPECT_EQ(s.dropped, 0u);
}

TEST(PersistenceSink, ExhaustedRetriesDropTheEvent) {
    auto store = std::make_shared<MemoryEventStore>();
    store->fail_next_appends(3);
    PersistenceSink sink(store, fast_retry());

    EXPECT_FALSE(sink.store(make_event(base_time(), ComponentClass::EDITOR, 1.0)).has_value());
    EXPECT_EQ(store->append_calls(), 3);
    EXPECT_EQ(sink.stats().dropped, 1u);

    // The next write goes through normally.
    EXPECT_TRUE(sink.store(make_event(base_time(), ComponentClass::EDITOR, 1.0)).has_value());
    EXPECT_EQ(store->size(), 1u);
}

TEST(PersistenceSink, FailingStoreDoesNotStopConsumer) {
    auto bus   = std::make_shared<EventBus>(1000);
    auto store = std::make_shared<MemoryEventStore>();
    store->fail_next_appends(MemoryEventStore::kAlways);

    auto sink = std::make_shared<PersistenceSink>(store, fast_retry());
    CancellationSource cancel;
    sink->start(bus->subscribe("persistence"), cancel.token());

    publish_synthetic(*bus, ComponentClass::EDITOR, 10, [](std::size_t) { return Micros(5); });
    ASSERT_TRUE(eventually([&]() { return sink->stats().dropped == 10; }));
    EXPECT_TRUE(sink->running());

    store->fail_next_appends(0);
    publish_synthetic(*bus, ComponentClass::EDITOR, 5, [](std::size_t) { return Micros(5); });
    ASSERT_TRUE(eventually([&]() { return sink->stats().stored == 5; }));

    cancel.cancel(ShutdownMode::GRACEFUL);
    bus->close();
    sink->join();
    EXPECT_FALSE(sink->running());
    EXPECT_EQ(store->size(), 5u);
}

TEST(PersistenceSink, GracefulStopDrainsBacklog) {
    auto bus   = std::make_shared<EventBus>(5000);
    auto store = std::make_shared<MemoryEventStore>();
    auto sub   = bus->subscribe("persistence");
    publish_synthetic(*bus, ComponentClass::SYSTEM, 2000, [](std::size_t i) { return Micros(i); });

    PersistenceSink sink(store, fast_retry());
    CancellationSource cancel;
    cancel.cancel(ShutdownMode::GRACEFUL);
    bus->close();
    sink.start(sub, cancel.token());
    sink.join();

    EXPECT_EQ(store->size(), 2000u);
    EXPECT_EQ(sink.stats().stored, 2000u);
    EXPECT_LE(sink.stats().batches, 2000u);
    EXPECT_GE(sink.stats().batches, 2000u / 16u);
}

TEST(PersistenceSink, ForcedStopLeavesBacklog) {
    auto bus   = std::make_shared<EventBus>(5000);
    auto store = std::make_shared<MemoryEventStore>();
    auto sub   = bus->subscribe("persistence");
    publish_synthetic(*bus, ComponentClass::SYSTEM, 500, [](std::size_t) { return Micros(1); });

    PersistenceSink sink(store, fast_retry());
    CancellationSource cancel;
    cancel.cancel(ShutdownMode::FORCED);
    sink.start(sub, cancel.token());
    sink.join();

    EXPECT_EQ(store->size(), 0u);
}

TEST(PersistenceSink, ReadsPassThroughToStore) {
    auto store = std::make_shared<MemoryEventStore>();
    PersistenceSink sink(store, fast_retry());
    const Timestamp t0 = base_time();
    sink.store(make_event(t0, ComponentClass::EDITOR, 1.0));
    sink.store(make_event(t0 + 1s, ComponentClass::TERMINAL, 1.0));

    EXPECT_EQ(sink.recent(10).size(), 2u);
    EXPECT_EQ(sink.recent(10, ComponentClass::TERMINAL).size(), 1u);
    EXPECT_EQ(sink.between(t0, t0 + 1s).size(), 1u);
    ASSERT_TRUE(sink.last_event_time().has_value());
    EXPECT_EQ(*sink.last_event_time(), t0 + 1s);
    EXPECT_EQ(sink.purge(t0 + 1s), 1u);

    store->fail_reads(true);
    EXPECT_THROW(sink.recent(10), StoreError);
}

TEST(PersistenceSink, GracefulDrainStillBacksOff) {
    auto bus   = std::make_shared<EventBus>(10);
    auto store = std::make_shared<MemoryEventStore>();
    store->fail_next_appends(2);
    auto sub = bus->subscribe("persistence");
    publish_synthetic(*bus, ComponentClass::EDITOR, 1, [](std::size_t) { return Micros(1); });

    SinkConfig cfg;
    cfg.max_attempts    = 3;
    cfg.initial_backoff = 100ms;
    cfg.max_backoff     = 1000ms;
    PersistenceSink sink(store, cfg);

    CancellationSource cancel;
    cancel.cancel(ShutdownMode::GRACEFUL);
    bus->close();

    auto t0 = std::chrono::steady_clock::now();
    sink.start(sub, cancel.token());
    sink.join();

    // 100ms then 200ms of backoff before the third attempt lands.
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 300ms);
    EXPECT_EQ(store->append_calls(), 3);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(sink.stats().dropped, 0u);
}

TEST(PersistenceSink, ForcedStopCutsBackoffShort) {
    auto store = std::make_shared<MemoryEventStore>();
    store->fail_next_appends(MemoryEventStore::kAlways);

    SinkConfig cfg;
    cfg.max_attempts    = 5;
    cfg.initial_backoff = 5000ms;
    cfg.max_backoff     = 5000ms;
    PersistenceSink sink(store, cfg);

    CancellationSource cancel;
    std::thread stopper([&]() {
        std::this_thread::sleep_for(100ms);
        cancel.cancel(ShutdownMode::FORCED);
    });

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(sink.store(make_event(base_time(), ComponentClass::EDITOR, 1.0), cancel.token())
                     .has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2000ms);
    stopper.join();
    EXPECT_EQ(store->append_calls(), 1);
    EXPECT_EQ(sink.stats().dropped, 1u);
}

TEST(PersistenceSink, NonStoreExceptionsCountAsFailedAttempts) {
    auto bus   = std::make_shared<EventBus>(100);
    auto store = std::make_shared<BrokenStore>();
    auto sink  = std::make_shared<PersistenceSink>(store, fast_retry());

    CancellationSource cancel;
    sink->start(bus->subscribe("persistence"), cancel.token());

    publish_synthetic(*bus, ComponentClass::EDITOR, 3, [](std::size_t) { return Micros(5); });
    ASSERT_TRUE(eventually([&]() { return sink->stats().dropped == 3; }));
    EXPECT_TRUE(sink->running());
    EXPECT_GE(sink->stats().write_failures, 3u);

    store->set_throwing(false);
    publish_synthetic(*bus, ComponentClass::EDITOR, 2, [](std::size_t) { return Micros(5); });
    ASSERT_TRUE(eventually([&]() { return sink->stats().stored == 2; }));

    cancel.cancel(ShutdownMode::GRACEFUL);
    bus->close();
    sink->join();
    EXPECT_EQ(store->size(), 2u);
}
