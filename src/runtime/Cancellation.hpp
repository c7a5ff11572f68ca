#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace latmon {

enum class ShutdownMode {
    GRACEFUL,   // stop producing, drain buffered events, then exit
    FORCED,     // exit now, buffered events are lost
};

const char* to_string(ShutdownMode m);

// ---------------------------------------------------------------------------
// Cooperative cancellation.
//
// One CancellationSource per pipeline; every task holds a CancellationToken
// copied from it. The source is the only writer. Escalation is one-way:
// GRACEFUL may be upgraded to FORCED, never the reverse.
//
// wait_for() is the suspension point for every sleeping loop: it returns
// early as soon as cancel() is called. wait_forced_for() only returns early
// on FORCED, for sleeps that must still happen while a graceful stop
// drains (write backoff).
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() = default;

    bool cancelled() const;
    bool forced() const;
    std::optional<ShutdownMode> mode() const;

    // true if cancellation was requested before or during the wait.
    bool wait_for(std::chrono::milliseconds d) const;

    // true if a forced stop was requested before or during the wait.
    bool wait_forced_for(std::chrono::milliseconds d) const;

private:
    friend class CancellationSource;

    struct State {
        std::atomic<int> mode{-1};   // -1 = running
        mutable std::mutex mtx;
        mutable std::condition_variable cv;
    };

    explicit CancellationToken(std::shared_ptr<State> s) : state_(std::move(s)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }

    void cancel(ShutdownMode mode);
    bool cancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace latmon
