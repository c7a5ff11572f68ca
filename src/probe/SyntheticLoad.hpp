#pragma once
#include <cstddef>
#include <functional>

#include "bus/EventBus.hpp"

namespace latmon {

// Duration of the i-th synthetic event.
using DurationFn = std::function<Micros(std::size_t)>;

// Publishes n synthetic-test events for `component`, timestamped now.
// Returns how many the bus accepted.
std::size_t publish_synthetic(EventBus& bus, ComponentClass component,
                              std::size_t n, const DurationFn& duration_of);

// Durations spread evenly over [lo, hi] across n events.
DurationFn uniform_durations(Micros lo, Micros hi, std::size_t n);

} // namespace latmon
