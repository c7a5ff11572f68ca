#pragma once
#include <cstdint>
#include <limits>
#include <vector>

#include "aggregate/LatencyHistogram.hpp"
#include "util/Clock.hpp"

namespace latmon {

// Ring of per-slice histograms covering slices * slice_width of time.
// A slot is recycled when an event for a newer slice lands in it. Events
// older than the slice currently held by their slot are rejected.
// Memory is fixed at construction: slices * (bounds + 1) cells.
class RollingWindow {
public:
    RollingWindow(std::vector<int64_t> bounds_us, std::size_t slices, Micros slice_width);

    // false when the event is too old for the window.
    bool record(Timestamp ts, Micros duration);

    // Merge of every slice still inside the window ending at `now`.
    // Slices later than the one holding `now` are left out.
    // `span` receives the time covered: from the oldest live slice's start
    // to `now`, capped at the window length.
    LatencyHistogram merged(Timestamp now, Micros* span = nullptr) const;

    std::size_t slices()      const { return slots_.size(); }
    Micros      slice_width() const { return slice_width_; }
    Micros      length()      const { return slice_width_ * static_cast<int64_t>(slots_.size()); }
    std::size_t cell_count()  const;

private:
    struct Slot {
        int64_t epoch{std::numeric_limits<int64_t>::min()};   // never written
        LatencyHistogram hist;
        explicit Slot(const std::vector<int64_t>& b) : hist(b) {}
    };

    int64_t epoch_of(Timestamp ts) const;

    std::vector<int64_t> bounds_;
    Micros               slice_width_;
    std::vector<Slot>    slots_;
};

} // namespace latmon
