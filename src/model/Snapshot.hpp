#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "model/Types.hpp"
#include "util/Clock.hpp"

namespace latmon {

// Rolling-window summary for one component class. Durations in milliseconds.
struct PerformanceSnapshot {
    ComponentClass component{ComponentClass::SYSTEM};
    uint64_t  count{0};
    double    avg_ms{0.0};
    double    min_ms{0.0};
    double    max_ms{0.0};
    double    p50_ms{0.0};
    double    p95_ms{0.0};
    double    p99_ms{0.0};
    double    events_per_second{0.0};
    double    window_seconds{0.0};
    std::optional<Timestamp> last_updated;
};

struct ResourceUsage {
    uint64_t uptime_seconds{0};
    uint64_t memory_usage_mb{0};
    double   cpu_usage_percent{0.0};
};

// Whole-machine figures, bytes and seconds.
struct HostResources {
    uint64_t memory_total{0};
    uint64_t memory_used{0};
    uint64_t memory_available{0};
    uint32_t cpu_count{0};
    double   load_one{0.0};
    double   load_five{0.0};
    double   load_fifteen{0.0};
    uint64_t processes{0};
    uint64_t uptime_seconds{0};
    Timestamp sampled_at{};
};

// Built on demand by QueryService. Optional fields are empty when the part
// of the view that feeds them was unavailable; `degraded` says why.
struct SystemStatus {
    std::string summary;
    std::optional<uint64_t>  total_events;
    std::vector<std::string> active_samplers;
    std::vector<PerformanceSnapshot> metrics;
    std::optional<Timestamp> last_event_time;
    ResourceUsage resources;

    uint64_t bus_dropped{0};
    uint64_t persisted{0};
    uint64_t write_failures{0};
    uint64_t write_drops{0};

    std::vector<std::string> degraded;
};

void to_json(nlohmann::json& j, const PerformanceSnapshot& s);
void to_json(nlohmann::json& j, const SystemStatus& s);
void to_json(nlohmann::json& j, const HostResources& h);

} // namespace latmon
