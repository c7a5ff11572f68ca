#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/LatencyEvent.hpp"

namespace latmon {

// Any failure of the durable store. Callers decide whether to retry.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Durable event storage.
//
// append() is atomic per batch: either every event gets an id or none is
// written. Readers never see a partially written batch.
// All methods throw StoreError on failure.
// ---------------------------------------------------------------------------
class EventStore {
public:
    virtual ~EventStore() = default;

    // Returns one id per input event, in order.
    virtual std::vector<int64_t> append(const std::vector<LatencyEvent>& batch) = 0;

    // Newest first (timestamp desc, then id desc).
    virtual std::vector<LatencyEvent> recent(std::size_t limit,
                                             std::optional<ComponentClass> component) = 0;

    // from <= timestamp < to, oldest first.
    virtual std::vector<LatencyEvent> between(Timestamp from, Timestamp to,
                                              std::optional<ComponentClass> component) = 0;

    // Deletes events with timestamp strictly before `cutoff`. Returns rows removed.
    virtual uint64_t purge_before(Timestamp cutoff) = 0;

    virtual uint64_t count() = 0;
    virtual std::optional<Timestamp> last_timestamp() = 0;

    virtual std::string describe() const = 0;
};

} // namespace latmon
