#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "runtime/Cancellation.hpp"
#include "storage/PersistenceSink.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// Periodic purge of events older than the retention horizon.
//
// First pass right after start(), then one every `interval`. Each pass
// deletes events strictly older than now - retention_days; an event sitting
// exactly on the cutoff survives. A failed pass is logged and the next one
// runs on schedule. Never stops the process.
// ---------------------------------------------------------------------------
class RetentionCompactor {
public:
    RetentionCompactor(std::shared_ptr<PersistenceSink> sink,
                       uint32_t retention_days,
                       std::chrono::seconds interval = std::chrono::hours(24));
    ~RetentionCompactor();

    RetentionCompactor(const RetentionCompactor&) = delete;
    RetentionCompactor& operator=(const RetentionCompactor&) = delete;

    void start(CancellationToken token);
    void join();

    // One pass against the given clock. Rows removed, nullopt on failure.
    std::optional<uint64_t> run_once(Timestamp now);

    Timestamp cutoff_for(Timestamp now) const;

    uint32_t retention_days() const { return retention_days_; }
    uint64_t passes()         const { return passes_.load(); }
    uint64_t failures()       const { return failures_.load(); }
    uint64_t purged()         const { return purged_.load(); }

private:
    void run(CancellationToken token);

    std::shared_ptr<PersistenceSink> sink_;
    uint32_t             retention_days_;
    std::chrono::seconds interval_;

    std::atomic<bool>     running_{false};
    std::thread           worker_;
    std::atomic<uint64_t> passes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> purged_{0};
};

} // namespace latmon
