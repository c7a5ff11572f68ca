#include "aggregate/LatencyHistogram.hpp"
#include <algorithm>
#include <stdexcept>

using namespace latmon;

LatencyHistogram::LatencyHistogram(std::vector<int64_t> bounds_us)
    : bounds_(std::move(bounds_us)) {
    if (bounds_.empty()) {
        throw std::invalid_argument("histogram needs at least one bound");
    }
    for (std::size_t i = 0; i < bounds_.size(); ++i) {
        if (bounds_[i] <= 0 || (i > 0 && bounds_[i] <= bounds_[i - 1])) {
            throw std::invalid_argument("histogram bounds must be positive and strictly increasing");
        }
    }
    counts_.assign(bounds_.size() + 1, 0);
}

std::vector<int64_t> LatencyHistogram::default_bounds() {
    std::vector<int64_t> b;
    b.reserve(16);
    int64_t v = 1000;
    for (int i = 0; i < 16; ++i) {
        b.push_back(v);
        v *= 2;
    }
    return b;
}

std::size_t LatencyHistogram::bucket_for(int64_t us) const {
    // First bound strictly greater than us.
    auto it = std::upper_bound(bounds_.begin(), bounds_.end(), us);
    return static_cast<std::size_t>(it - bounds_.begin());
}

void LatencyHistogram::record(Micros duration) {
    int64_t us = std::max<int64_t>(0, duration.count());
    counts_[bucket_for(us)]++;
    if (count_ == 0) {
        min_us_ = max_us_ = us;
    } else {
        min_us_ = std::min(min_us_, us);
        max_us_ = std::max(max_us_, us);
    }
    count_++;
    sum_us_ += us;
}

void LatencyHistogram::merge(const LatencyHistogram& other) {
    if (other.bounds_ != bounds_) {
        throw std::invalid_argument("cannot merge histograms with different bounds");
    }
    if (other.count_ == 0) return;

    for (std::size_t i = 0; i < counts_.size(); ++i) counts_[i] += other.counts_[i];
    if (count_ == 0) {
        min_us_ = other.min_us_;
        max_us_ = other.max_us_;
    } else {
        min_us_ = std::min(min_us_, other.min_us_);
        max_us_ = std::max(max_us_, other.max_us_);
    }
    count_  += other.count_;
    sum_us_ += other.sum_us_;
}

void LatencyHistogram::reset() {
    std::fill(counts_.begin(), counts_.end(), 0);
    count_ = 0;
    sum_us_ = min_us_ = max_us_ = 0;
}

double LatencyHistogram::mean_us() const {
    return count_ ? static_cast<double>(sum_us_) / static_cast<double>(count_) : 0.0;
}

double LatencyHistogram::percentile_us(double q) const {
    if (count_ == 0) return 0.0;
    q = std::clamp(q, 0.0, 1.0);

    const double lo_clamp = static_cast<double>(min_us_);
    const double hi_clamp = static_cast<double>(max_us_);
    const double rank = q * static_cast<double>(count_);
    if (rank <= 0.0) return lo_clamp;

    uint64_t before = 0;
    for (std::size_t i = 0; i < counts_.size(); ++i) {
        const uint64_t c = counts_[i];
        if (c == 0) continue;
        if (static_cast<double>(before + c) >= rank) {
            double lower = (i == 0) ? 0.0 : static_cast<double>(bounds_[i - 1]);
            double upper = (i == bounds_.size()) ? hi_clamp : static_cast<double>(bounds_[i]);
            lower = std::max(lower, lo_clamp);
            upper = std::min(upper, hi_clamp);
            if (upper < lower) upper = lower;

            double frac = (rank - static_cast<double>(before)) / static_cast<double>(c);
            double v = lower + frac * (upper - lower);
            return std::clamp(v, lo_clamp, hi_clamp);
        }
        before += c;
    }
    return hi_clamp;
}
