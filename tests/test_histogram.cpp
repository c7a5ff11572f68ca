#include <gtest/gtest.h>

#include "aggregate/LatencyHistogram.hpp"
#include "aggregate/RollingWindow.hpp"
#include "TestSupport.hpp"

using namespace latmon;
using namespace latmon::test;
using namespace std::chrono_literals;

namespace {

Micros ms(double v) {
    return Micros(static_cast<int64_t>(v * 1000.0));
}

// Width of the bucket holding `us` in h.
double bucket_width_us(const LatencyHistogram& h, int64_t us) {
    std::size_t i = h.bucket_for(us);
    const auto& b = h.bounds();
    double lo = i == 0 ? 0.0 : static_cast<double>(b[i - 1]);
    double hi = i == b.size() ? static_cast<double>(h.max_us()) : static_cast<double>(b[i]);
    return hi - lo;
}

} // namespace

TEST(LatencyHistogram, DefaultBoundsDoubleFromOneMs) {
    auto b = LatencyHistogram::default_bounds();
    ASSERT_EQ(b.size(), 16u);
    EXPECT_EQ(b.front(), 1000);
    EXPECT_EQ(b.back(), 32768000);
    LatencyHistogram h(b);
    EXPECT_EQ(h.bucket_count(), 17u);
}

TEST(LatencyHistogram, RejectsUnsortedBounds) {
    EXPECT_THROW(LatencyHistogram({1000, 1000}), std::invalid_argument);
    EXPECT_THROW(LatencyHistogram({2000, 1000}), std::invalid_argument);
    EXPECT_THROW(LatencyHistogram(std::vector<int64_t>{}), std::invalid_argument);
}

TEST(LatencyHistogram, BucketEdges) {
    LatencyHistogram h(LatencyHistogram::default_bounds());
    EXPECT_EQ(h.bucket_for(0), 0u);      // underflow
    EXPECT_EQ(h.bucket_for(999), 0u);
    EXPECT_EQ(h.bucket_for(1000), 1u);
    EXPECT_EQ(h.bucket_for(1999), 1u);
    EXPECT_EQ(h.bucket_for(2000), 2u);
    EXPECT_EQ(h.bucket_for(100000000), 16u);   // overflow
}

TEST(LatencyHistogram, EmptyReportsZeros) {
    LatencyHistogram h(LatencyHistogram::default_bounds());
    EXPECT_EQ(h.count(), 0u);
    EXPECT_EQ(h.percentile_us(0.5), 0.0);
    EXPECT_EQ(h.mean_us(), 0.0);
}

TEST(LatencyHistogram, UniformOneToThousandMsPercentilesWithinABucket) {
    LatencyHistogram h(LatencyHistogram::default_bounds());
    for (int i = 1; i <= 100; ++i) h.record(ms(i * 10.0));   // 10ms .. 1000ms

    const double true_p50 = 500'000, true_p95 = 950'000, true_p99 = 990'000;
    double p50 = h.percentile_us(0.50);
    double p95 = h.percentile_us(0.95);
    double p99 = h.percentile_us(0.99);

    EXPECT_NEAR(p50, true_p50, bucket_width_us(h, 500'000));
    EXPECT_NEAR(p95, true_p95, bucket_width_us(h, 950'000));
    EXPECT_NEAR(p99, true_p99, bucket_width_us(h, 990'000));
    EXPECT_LE(p50, p95);
    EXPECT_LE(p95, p99);
    EXPECT_LE(p99, 1'000'000.0);
    EXPECT_EQ(h.min_us(), 10'000);
    EXPECT_EQ(h.max_us(), 1'000'000);
    EXPECT_DOUBLE_EQ(h.mean_us(), 505'000.0);
}

TEST(LatencyHistogram, ConstantDurationCollapsesToThatValue) {
    LatencyHistogram h(LatencyHistogram::default_bounds());
    for (int i = 0; i < 1000; ++i) h.record(ms(42));
    EXPECT_DOUBLE_EQ(h.percentile_us(0.50), 42'000.0);
    EXPECT_DOUBLE_EQ(h.percentile_us(0.99), 42'000.0);
    EXPECT_DOUBLE_EQ(h.mean_us(), 42'000.0);
}

TEST(LatencyHistogram, OverflowBucketUsesObservedMax) {
    LatencyHistogram h({1000, 2000});
    h.record(ms(5));
    h.record(ms(10));
    double p99 = h.percentile_us(0.99);
    EXPECT_GE(p99, 5000.0);
    EXPECT_LE(p99, 10000.0);
}

TEST(LatencyHistogram, MergeAddsCountsAndExtremes) {
    LatencyHistogram a(LatencyHistogram::default_bounds());
    LatencyHistogram b(LatencyHistogram::default_bounds());
    a.record(ms(3));
    b.record(ms(300));
    b.record(ms(30));
    a.merge(b);
    EXPECT_EQ(a.count(), 3u);
    EXPECT_EQ(a.min_us(), 3000);
    EXPECT_EQ(a.max_us(), 300000);

    LatencyHistogram other({5, 10});
    EXPECT_THROW(a.merge(other), std::invalid_argument);
}

TEST(RollingWindow, OldSlicesFallOutOfTheWindow) {
    RollingWindow w(LatencyHistogram::default_bounds(), 3, std::chrono::seconds(10));
    const Timestamp t0 = base_time();

    ASSERT_TRUE(w.record(t0, ms(1)));
    ASSERT_TRUE(w.record(t0 + 10s, ms(2)));
    ASSERT_TRUE(w.record(t0 + 20s, ms(3)));

    EXPECT_EQ(w.merged(t0 + 25s).count(), 3u);
    // At t0+30s the first slice is older than three slices.
    EXPECT_EQ(w.merged(t0 + 30s).count(), 2u);
    EXPECT_EQ(w.merged(t0 + 60s).count(), 0u);
}

TEST(RollingWindow, RecyclesSlotForNewerSlice) {
    RollingWindow w(LatencyHistogram::default_bounds(), 2, std::chrono::seconds(1));
    const Timestamp t0 = base_time();
    w.record(t0, ms(100));
    w.record(t0 + 2s, ms(1));   // same slot as t0, newer slice

    auto h = w.merged(t0 + 2s);
    EXPECT_EQ(h.count(), 1u);
    EXPECT_EQ(h.max_us(), 1000);
}

TEST(RollingWindow, RejectsEventsOlderThanTheirSlot) {
    RollingWindow w(LatencyHistogram::default_bounds(), 2, std::chrono::seconds(1));
    const Timestamp t0 = base_time();
    ASSERT_TRUE(w.record(t0 + 2s, ms(1)));
    EXPECT_FALSE(w.record(t0, ms(1)));
}

TEST(RollingWindow, SlicesAfterNowAreNotMerged) {
    RollingWindow w(LatencyHistogram::default_bounds(), 10, std::chrono::seconds(1));
    const Timestamp t0 = base_time();
    w.record(t0, ms(1));
    w.record(t0 + 5s, ms(2));

    auto h = w.merged(t0 + 500ms);
    EXPECT_EQ(h.count(), 1u);
    EXPECT_EQ(h.max_us(), 1000);
    EXPECT_EQ(w.merged(t0 + 5s).count(), 2u);
}

TEST(RollingWindow, SpanCoversOldestLiveSlice) {
    RollingWindow w(LatencyHistogram::default_bounds(), 60, std::chrono::seconds(60));
    const Timestamp t0 = base_time();
    w.record(t0, ms(1));
    Micros span{0};
    w.merged(t0 + 30s, &span);
    EXPECT_EQ(span, Micros(30'000'000));
}

TEST(RollingWindow, MemoryIsFixedRegardlessOfVolume) {
    RollingWindow w(LatencyHistogram::default_bounds(), 60, std::chrono::seconds(60));
    const std::size_t cells = w.cell_count();
    EXPECT_EQ(cells, 60u * 17u);

    for (int i = 0; i < 200000; ++i) {
        w.record(base_time() + std::chrono::milliseconds(i * 50), Micros(i % 5000000));
    }
    EXPECT_EQ(w.cell_count(), cells);
}
