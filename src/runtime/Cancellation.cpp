#include "runtime/Cancellation.hpp"
#include <thread>

using namespace latmon;

const char* latmon::to_string(ShutdownMode m) {
    return m == ShutdownMode::FORCED ? "forced" : "graceful";
}

bool CancellationToken::cancelled() const {
    return state_ && state_->mode.load() >= 0;
}

bool CancellationToken::forced() const {
    return state_ && state_->mode.load() == static_cast<int>(ShutdownMode::FORCED);
}

std::optional<ShutdownMode> CancellationToken::mode() const {
    if (!state_) return std::nullopt;
    int m = state_->mode.load();
    if (m < 0) return std::nullopt;
    return static_cast<ShutdownMode>(m);
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    if (!state_) {
        std::this_thread::sleep_for(d);
        return false;
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    return state_->cv.wait_for(lk, d, [this]() { return state_->mode.load() >= 0; });
}

bool CancellationToken::wait_forced_for(std::chrono::milliseconds d) const {
    if (!state_) {
        std::this_thread::sleep_for(d);
        return false;
    }
    const int forced = static_cast<int>(ShutdownMode::FORCED);
    std::unique_lock<std::mutex> lk(state_->mtx);
    return state_->cv.wait_for(lk, d, [this, forced]() { return state_->mode.load() == forced; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel(ShutdownMode mode) {
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        int want = static_cast<int>(mode);
        int cur  = state_->mode.load();
        // FORCED (1) outranks GRACEFUL (0); never downgrade.
        if (want > cur) state_->mode.store(want);
    }
    state_->cv.notify_all();
}

bool CancellationSource::cancelled() const {
    return state_->mode.load() >= 0;
}
