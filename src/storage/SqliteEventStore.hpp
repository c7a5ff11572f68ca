#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "storage/EventStore.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// SQLite-backed EventStore.
//
// Table latency_events, indexed on timestamp and on component_class.
// Timestamps are stored as fixed-width ISO-8601 text so string order is
// time order and range scans use the index.
//
// Two connections in WAL mode: a writer (append/purge, serialised by its
// own mutex) and a reader (queries, its own mutex). Readers see the last
// committed snapshot and never block the writer.
//
// The constructor creates the parent directory and the schema; any failure
// there throws StoreError.
// ---------------------------------------------------------------------------
class SqliteEventStore : public EventStore {
public:
    explicit SqliteEventStore(const std::string& path,
                              std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(2000));
    ~SqliteEventStore() override;

    SqliteEventStore(const SqliteEventStore&) = delete;
    SqliteEventStore& operator=(const SqliteEventStore&) = delete;

    std::vector<int64_t> append(const std::vector<LatencyEvent>& batch) override;
    std::vector<LatencyEvent> recent(std::size_t limit,
                                     std::optional<ComponentClass> component) override;
    std::vector<LatencyEvent> between(Timestamp from, Timestamp to,
                                      std::optional<ComponentClass> component) override;
    uint64_t purge_before(Timestamp cutoff) override;
    uint64_t count() override;
    std::optional<Timestamp> last_timestamp() override;

    std::string describe() const override;
    const std::string& path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace latmon
