#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "model/Types.hpp"
#include "util/Clock.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// One observed occurrence. Immutable after construction.
//
// The id is absent until the store assigns one. persisted_as() is the only
// way to attach it and returns a new value; calling it on an event that
// already carries an id throws std::logic_error.
// ---------------------------------------------------------------------------
class LatencyEvent {
public:
    LatencyEvent(Timestamp timestamp,
                 ComponentClass component,
                 SourceKind source,
                 Micros duration,
                 std::string description,
                 nlohmann::json metadata = nullptr);

    // Timestamped now.
    static LatencyEvent capture(ComponentClass component,
                                SourceKind source,
                                Micros duration,
                                std::string description,
                                nlohmann::json metadata = nullptr);

    LatencyEvent persisted_as(int64_t id) const;

    const std::optional<int64_t>& id() const { return id_; }
    Timestamp          timestamp()   const { return timestamp_; }
    ComponentClass     component()   const { return component_; }
    SourceKind         source()      const { return source_; }
    Micros             duration()    const { return duration_; }
    const std::string& description() const { return description_; }
    const nlohmann::json& metadata() const { return metadata_; }

    int64_t duration_us() const { return duration_.count(); }
    double  duration_ms() const { return duration_.count() / 1000.0; }

private:
    std::optional<int64_t> id_;
    Timestamp      timestamp_;
    ComponentClass component_;
    SourceKind     source_;
    Micros         duration_;
    std::string    description_;
    nlohmann::json metadata_;
};

void to_json(nlohmann::json& j, const LatencyEvent& e);

} // namespace latmon
