#pragma once
#include <cstdint>
#include <vector>

#include "util/Clock.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// Fixed-bucket duration histogram.
//
// With bounds b0 < b1 < ... < bn-1 (microseconds) there are n+1 buckets:
//   [0, b0)  [b0, b1)  ...  [bn-2, bn-1)  [bn-1, inf)
// record() touches one bucket plus count/sum/min/max. O(log n).
//
// percentile() walks cumulative counts, interpolates linearly inside the
// bucket holding the rank and clamps to the observed [min, max]. The
// overflow bucket's upper edge is the observed max.
// ---------------------------------------------------------------------------
class LatencyHistogram {
public:
    // Throws std::invalid_argument if bounds are empty or not strictly increasing.
    explicit LatencyHistogram(std::vector<int64_t> bounds_us);

    // Doubling from 1ms, 16 bounds (up to ~32.8s).
    static std::vector<int64_t> default_bounds();

    void record(Micros duration);
    void merge(const LatencyHistogram& other);
    void reset();

    uint64_t count()  const { return count_; }
    int64_t  sum_us() const { return sum_us_; }
    int64_t  min_us() const { return count_ ? min_us_ : 0; }
    int64_t  max_us() const { return count_ ? max_us_ : 0; }
    double   mean_us() const;

    // q in [0, 1]. 0 when empty.
    double percentile_us(double q) const;

    const std::vector<int64_t>&  bounds() const { return bounds_; }
    const std::vector<uint64_t>& counts() const { return counts_; }
    std::size_t bucket_count() const { return counts_.size(); }

    // Bucket index a duration lands in.
    std::size_t bucket_for(int64_t us) const;

private:
    std::vector<int64_t>  bounds_;
    std::vector<uint64_t> counts_;
    uint64_t count_{0};
    int64_t  sum_us_{0};
    int64_t  min_us_{0};
    int64_t  max_us_{0};
};

} // namespace latmon
