#include "model/Snapshot.hpp"

using namespace latmon;

static nlohmann::json optional_time(const std::optional<Timestamp>& t) {
    if (!t) return nullptr;
    return format_iso8601(*t);
}

void latmon::to_json(nlohmann::json& j, const PerformanceSnapshot& s) {
    j = nlohmann::json{
        {"component",         to_string(s.component)},
        {"total_events",      s.count},
        {"avg_duration_ms",   s.avg_ms},
        {"min_duration_ms",   s.min_ms},
        {"max_duration_ms",   s.max_ms},
        {"p50_duration_ms",   s.p50_ms},
        {"p95_duration_ms",   s.p95_ms},
        {"p99_duration_ms",   s.p99_ms},
        {"events_per_second", s.events_per_second},
        {"window_seconds",    s.window_seconds},
        {"last_updated",      optional_time(s.last_updated)},
    };
}

void latmon::to_json(nlohmann::json& j, const SystemStatus& s) {
    j = nlohmann::json{
        {"summary",              s.summary},
        {"total_events",         s.total_events ? nlohmann::json(*s.total_events)
                                                : nlohmann::json(nullptr)},
        {"active_samplers",      s.active_samplers},
        {"performance_metrics",  s.metrics},
        {"last_event_timestamp", optional_time(s.last_event_time)},
        {"uptime_seconds",       s.resources.uptime_seconds},
        {"memory_usage_mb",      s.resources.memory_usage_mb},
        {"cpu_usage_percent",    s.resources.cpu_usage_percent},
        {"dropped_events",       s.bus_dropped},
        {"persistence", {
            {"stored",         s.persisted},
            {"write_failures", s.write_failures},
            {"dropped",        s.write_drops},
        }},
        {"degraded",             s.degraded},
    };
}

void latmon::to_json(nlohmann::json& j, const HostResources& h) {
    j = nlohmann::json{
        {"system_resources", {
            {"memory", {
                {"total",     h.memory_total},
                {"used",      h.memory_used},
                {"available", h.memory_available},
            }},
            {"cpu", {{"cpu_count", h.cpu_count}}},
            {"load_average", {
                {"one_minute",      h.load_one},
                {"five_minutes",    h.load_five},
                {"fifteen_minutes", h.load_fifteen},
            }},
            {"processes", h.processes},
            {"uptime",    h.uptime_seconds},
        }},
        {"timestamp", format_iso8601(h.sampled_at)},
    };
}
