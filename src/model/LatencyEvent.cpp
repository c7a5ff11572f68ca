#include "model/LatencyEvent.hpp"
#include <stdexcept>

using namespace latmon;

LatencyEvent::LatencyEvent(Timestamp timestamp,
                           ComponentClass component,
                           SourceKind source,
                           Micros duration,
                           std::string description,
                           nlohmann::json metadata)
    : timestamp_(timestamp),
      component_(component),
      source_(source),
      duration_(duration.count() < 0 ? Micros(0) : duration),
      description_(std::move(description)),
      metadata_(std::move(metadata)) {}

LatencyEvent LatencyEvent::capture(ComponentClass component,
                                   SourceKind source,
                                   Micros duration,
                                   std::string description,
                                   nlohmann::json metadata) {
    return LatencyEvent(wall_now(), component, source, duration,
                        std::move(description), std::move(metadata));
}

LatencyEvent LatencyEvent::persisted_as(int64_t id) const {
    if (id_) {
        throw std::logic_error("event already persisted as id " +
                               std::to_string(*id_));
    }
    LatencyEvent copy(*this);
    copy.id_ = id;
    return copy;
}

void latmon::to_json(nlohmann::json& j, const LatencyEvent& e) {
    j = nlohmann::json{
        {"id",                    e.id() ? nlohmann::json(*e.id()) : nlohmann::json(nullptr)},
        {"timestamp",             format_iso8601(e.timestamp())},
        {"component_class",       to_string(e.component())},
        {"source_kind",           to_string(e.source())},
        {"duration_microseconds", e.duration_us()},
        {"description",           e.description()},
        {"metadata",              e.metadata()},
    };
}
