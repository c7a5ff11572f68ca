#include "probe/SyntheticLoad.hpp"
#include <iostream>

using namespace latmon;

std::size_t latmon::publish_synthetic(EventBus& bus, ComponentClass component,
                                      std::size_t n, const DurationFn& duration_of) {
    std::size_t accepted = 0;
    for (std::size_t i = 0; i < n; ++i) {
        Micros d = duration_of(i);
        auto ev = LatencyEvent::capture(component, SourceKind::SYNTHETIC_TEST, d,
                                        "Synthetic event " + std::to_string(i + 1),
                                        nlohmann::json{{"sequence", i + 1}});
        if (bus.publish(ev)) ++accepted;
    }
    if (accepted < n) {
        std::cerr << "[LATMON] Synthetic load: " << n - accepted << " of " << n
                  << " events rejected by the bus\n";
    }
    return accepted;
}

DurationFn latmon::uniform_durations(Micros lo, Micros hi, std::size_t n) {
    return [lo, hi, n](std::size_t i) {
        if (n <= 1) return lo;
        auto span = (hi - lo).count();
        return Micros(lo.count() + span * static_cast<int64_t>(i) / static_cast<int64_t>(n - 1));
    };
}
