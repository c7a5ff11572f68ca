#include "aggregate/RollingWindow.hpp"
#include <algorithm>
#include <stdexcept>

using namespace latmon;

RollingWindow::RollingWindow(std::vector<int64_t> bounds_us, std::size_t slices, Micros slice_width)
    : bounds_(std::move(bounds_us)), slice_width_(slice_width) {
    if (slices == 0) throw std::invalid_argument("rolling window needs at least one slice");
    if (slice_width_.count() <= 0) throw std::invalid_argument("slice width must be > 0");

    LatencyHistogram probe(bounds_);   // validates bounds once
    slots_.reserve(slices);
    for (std::size_t i = 0; i < slices; ++i) slots_.emplace_back(bounds_);
}

int64_t RollingWindow::epoch_of(Timestamp ts) const {
    int64_t us = to_micros(ts);
    int64_t w  = slice_width_.count();
    // floor division, pre-1970 timestamps included
    return us >= 0 ? us / w : -((-us + w - 1) / w);
}

bool RollingWindow::record(Timestamp ts, Micros duration) {
    const int64_t epoch = epoch_of(ts);
    const int64_t n = static_cast<int64_t>(slots_.size());
    Slot& slot = slots_[static_cast<std::size_t>(((epoch % n) + n) % n)];

    if (slot.epoch > epoch) return false;
    if (slot.epoch < epoch) {
        slot.hist.reset();
        slot.epoch = epoch;
    }
    slot.hist.record(duration);
    return true;
}

LatencyHistogram RollingWindow::merged(Timestamp now, Micros* span) const {
    const int64_t now_epoch = epoch_of(now);
    const int64_t n = static_cast<int64_t>(slots_.size());

    LatencyHistogram out(bounds_);
    int64_t oldest = now_epoch;
    for (const auto& slot : slots_) {
        if (slot.epoch <= now_epoch - n || slot.epoch > now_epoch) continue;
        if (slot.hist.count() == 0) continue;
        out.merge(slot.hist);
        oldest = std::min(oldest, slot.epoch);
    }

    if (span) {
        int64_t covered = to_micros(now) - oldest * slice_width_.count();
        covered = std::clamp<int64_t>(covered, 0, length().count());
        *span = Micros(covered);
    }
    return out;
}

std::size_t RollingWindow::cell_count() const {
    std::size_t cells = 0;
    for (const auto& slot : slots_) cells += slot.hist.bucket_count();
    return cells;
}
