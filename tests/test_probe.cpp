#include <gtest/gtest.h>
#include <thread>

#include "probe/CommandProbe.hpp"
#include "probe/SyntheticLoad.hpp"
#include "TestSupport.hpp"

using namespace latmon;
using namespace latmon::test;
using namespace std::chrono_literals;

TEST(CommandProbe, SuccessfulCallPublishesOneEvent) {
    auto bus = std::make_shared<EventBus>(10);
    auto sub = bus->subscribe("test");
    CommandProbe probe(bus, ComponentClass::TERMINAL);

    int r = probe.time("make -j8", []() {
        std::this_thread::sleep_for(20ms);
        return 7;
    });
    EXPECT_EQ(r, 7);
    EXPECT_EQ(probe.published(), 1u);

    std::vector<LatencyEvent> out;
    sub->drain(out, 10);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].component(), ComponentClass::TERMINAL);
    EXPECT_EQ(out[0].source(), SourceKind::COMMAND_EXECUTION);
    EXPECT_EQ(out[0].description(), "make -j8");
    EXPECT_EQ(out[0].metadata()["command"], "make -j8");
    EXPECT_GE(out[0].duration_us(), 20000);
}

TEST(CommandProbe, VoidCallablesAreTimedToo) {
    auto bus = std::make_shared<EventBus>(10);
    auto sub = bus->subscribe("test");
    CommandProbe probe(bus, ComponentClass::FILESYSTEM);
    bool ran = false;
    probe.time("touch", [&]() { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_EQ(sub->depth(), 1u);
}

TEST(CommandProbe, ThrowingCallPublishesNothing) {
    auto bus = std::make_shared<EventBus>(10);
    auto sub = bus->subscribe("test");
    CommandProbe probe(bus, ComponentClass::TERMINAL);

    EXPECT_THROW(probe.time("false", []() -> int { throw std::runtime_error("exit 1"); }),
                 std::runtime_error);
    EXPECT_EQ(probe.published(), 0u);
    EXPECT_EQ(sub->depth(), 0u);
}

TEST(CommandProbe, FullBusCountsRejection) {
    auto bus = std::make_shared<EventBus>(1);
    auto sub = bus->subscribe("test");
    CommandProbe probe(bus, ComponentClass::TERMINAL);
    probe.time("a", []() {});
    probe.time("b", []() {});
    EXPECT_EQ(probe.published(), 1u);
    EXPECT_EQ(probe.rejected(), 1u);
}

TEST(SyntheticLoad, PublishesRequestedCount) {
    auto bus = std::make_shared<EventBus>(100);
    auto sub = bus->subscribe("test");
    EXPECT_EQ(publish_synthetic(*bus, ComponentClass::NETWORK, 25,
                                [](std::size_t i) { return Micros(i * 10); }), 25u);

    std::vector<LatencyEvent> out;
    sub->drain(out, 100);
    ASSERT_EQ(out.size(), 25u);
    EXPECT_EQ(out[3].duration_us(), 30);
    EXPECT_EQ(out[3].source(), SourceKind::SYNTHETIC_TEST);
    EXPECT_EQ(out[3].metadata()["sequence"], 4);
}

TEST(SyntheticLoad, ReportsWhatTheBusAccepted) {
    auto bus = std::make_shared<EventBus>(10);
    auto sub = bus->subscribe("test");
    EXPECT_EQ(publish_synthetic(*bus, ComponentClass::NETWORK, 15,
                                [](std::size_t) { return Micros(1); }), 10u);
}

TEST(SyntheticLoad, UniformDurationsSpanTheRange) {
    auto fn = uniform_durations(Micros(10000), Micros(1000000), 100);
    EXPECT_EQ(fn(0), Micros(10000));
    EXPECT_EQ(fn(99), Micros(1000000));
    EXPECT_LT(fn(49), fn(50));

    auto single = uniform_durations(Micros(5), Micros(50), 1);
    EXPECT_EQ(single(0), Micros(5));
}
