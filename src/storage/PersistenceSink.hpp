#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "bus/EventBus.hpp"
#include "runtime/Cancellation.hpp"
#include "storage/EventStore.hpp"

namespace latmon {

struct SinkConfig {
    std::size_t               batch_size{64};
    uint32_t                  max_attempts{3};
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{1000};
};

struct SinkStats {
    uint64_t stored{0};
    uint64_t write_failures{0};   // failed attempts, retried or not
    uint64_t dropped{0};          // events given up on after max_attempts
    uint64_t batches{0};
};

// ---------------------------------------------------------------------------
// The single writer in front of the EventStore.
//
// The consumer thread pops one event (100ms wait), drains whatever else is
// queued up to batch_size, and writes the batch in one transaction. A
// failed write is retried with exponential backoff up to max_attempts; the
// batch is then dropped and logged. Failures never reach the Samplers.
//
// Backoff sleeps are cut short only by a forced stop. On a graceful stop the
// loop keeps going, backoff included, until the bus reports CLOSED; on a
// forced stop it exits at once and whatever is queued is lost.
//
// Reads (recent, purge, counts) go straight to the store. They throw
// StoreError; callers that need timeouts wrap them (see QueryService).
// ---------------------------------------------------------------------------
class PersistenceSink {
public:
    PersistenceSink(std::shared_ptr<EventStore> store, SinkConfig cfg = SinkConfig{});
    ~PersistenceSink();

    PersistenceSink(const PersistenceSink&) = delete;
    PersistenceSink& operator=(const PersistenceSink&) = delete;

    void start(std::shared_ptr<EventSubscription> sub, CancellationToken token);
    void join();

    // Synchronous write with the same retry policy the consumer uses.
    // Returns the persisted copy, or nullopt if it was dropped.
    std::optional<LatencyEvent> store(const LatencyEvent& event,
                                      const CancellationToken& token = CancellationToken());

    std::vector<LatencyEvent> recent(std::size_t limit,
                                     std::optional<ComponentClass> component = std::nullopt);
    std::vector<LatencyEvent> between(Timestamp from, Timestamp to,
                                      std::optional<ComponentClass> component = std::nullopt);
    uint64_t                  purge(Timestamp older_than);
    uint64_t                  total_events();
    std::optional<Timestamp>  last_event_time();

    SinkStats stats() const;
    bool      running() const { return running_.load(); }
    const SinkConfig& config() const { return cfg_; }

private:
    void run(std::shared_ptr<EventSubscription> sub, CancellationToken token);

    // ids on success, nullopt once every attempt has failed or the token
    // was cancelled mid-backoff.
    std::optional<std::vector<int64_t>> write_with_retry(const std::vector<LatencyEvent>& batch,
                                                         const CancellationToken& token);

    std::shared_ptr<EventStore> store_;
    SinkConfig cfg_;

    std::atomic<bool> running_{false};
    std::thread       worker_;

    std::atomic<uint64_t> stored_{0};
    std::atomic<uint64_t> write_failures_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> batches_{0};
};

} // namespace latmon
