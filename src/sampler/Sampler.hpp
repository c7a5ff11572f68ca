#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "bus/EventBus.hpp"
#include "runtime/Cancellation.hpp"
#include "sampler/ClassificationRules.hpp"
#include "sampler/ProcessTable.hpp"

namespace latmon {

enum class SamplerState {
    IDLE,
    SCANNING,
    CLASSIFYING,
    EMITTING,
    SLEEPING,
    TERMINATED,
};

const char* to_string(SamplerState s);

struct SamplerStats {
    uint64_t ticks{0};
    uint64_t scan_failures{0};
    uint64_t matched{0};
    uint64_t published{0};
    uint64_t rejected{0};      // bus full or closed
};

// ---------------------------------------------------------------------------
// Polls the process table for ONE component class on a fixed cadence and
// publishes a LatencyEvent per matching process.
//
// duration    = time from the start of the scan to that event's emission
// timestamp   = wall clock, clamped so it never goes backwards for this sampler
//
// THREADING: own worker thread. The only shared object it touches is the
//   EventBus, whose publish() never blocks. A failing scan is logged and the
//   tick skipped; the loop keeps going until the token is cancelled. The
//   tick in progress always completes before the thread exits.
// ---------------------------------------------------------------------------
class Sampler {
public:
    Sampler(std::string name,
            ComponentClass component,
            std::chrono::milliseconds interval,
            std::unique_ptr<ProcessTable> table,
            const ClassificationRules& rules,
            std::shared_ptr<EventBus> bus);
    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    void start(CancellationToken token);
    void join();

    // One Scanning → Classifying → Emitting pass. Returns events published.
    // Public so tests can drive the sampler without a thread.
    std::size_t tick();

    const std::string&        name()      const { return name_; }
    ComponentClass            component() const { return component_; }
    std::chrono::milliseconds interval()  const { return interval_; }
    SamplerState              state()     const { return state_.load(); }
    bool                      running()   const { return running_.load(); }
    SamplerStats              stats()     const;

private:
    void run(CancellationToken token);
    Timestamp next_timestamp();

    std::string               name_;
    ComponentClass            component_;
    std::chrono::milliseconds interval_;
    std::unique_ptr<ProcessTable> table_;
    ClassificationRules       rules_;
    std::shared_ptr<EventBus> bus_;

    std::vector<ProcessInfo>  procs_;
    Timestamp                 last_ts_{};

    std::atomic<SamplerState> state_{SamplerState::IDLE};
    std::atomic<bool>         running_{false};
    std::thread               worker_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> scan_failures_{0};
    std::atomic<uint64_t> matched_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace latmon
