#include "retention/RetentionCompactor.hpp"
#include <iostream>
#include <stdexcept>

using namespace latmon;

RetentionCompactor::RetentionCompactor(std::shared_ptr<PersistenceSink> sink,
                                       uint32_t retention_days,
                                       std::chrono::seconds interval)
    : sink_(std::move(sink)), retention_days_(retention_days), interval_(interval) {
    if (!sink_) throw std::invalid_argument("RetentionCompactor needs a sink");
    if (retention_days_ == 0) throw std::invalid_argument("retention_days must be > 0");
    if (interval_.count() <= 0) throw std::invalid_argument("compaction interval must be > 0");
}

RetentionCompactor::~RetentionCompactor() {
    join();
}

Timestamp RetentionCompactor::cutoff_for(Timestamp now) const {
    return now - std::chrono::duration_cast<Micros>(std::chrono::hours(24) * retention_days_);
}

std::optional<uint64_t> RetentionCompactor::run_once(Timestamp now) {
    passes_.fetch_add(1, std::memory_order_relaxed);
    const Timestamp cutoff = cutoff_for(now);
    try {
        uint64_t n = sink_->purge(cutoff);
        purged_.fetch_add(n, std::memory_order_relaxed);
        std::cout << "[RETENTION] Purged " << n << " events older than "
                  << format_iso8601(cutoff) << "\n";
        return n;
    } catch (const StoreError& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[RETENTION] Purge failed, will retry next pass: " << e.what() << "\n";
        return std::nullopt;
    }
}

void RetentionCompactor::start(CancellationToken token) {
    if (running_.exchange(true)) return;
    std::cout << "[RETENTION] Started (keep " << retention_days_ << " days, every "
              << interval_.count() << "s)\n";
    worker_ = std::thread([this, token]() { run(token); });
}

void RetentionCompactor::join() {
    if (worker_.joinable()) worker_.join();
}

void RetentionCompactor::run(CancellationToken token) {
    while (!token.cancelled()) {
        run_once(wall_now());
        if (token.wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(interval_))) break;
    }
    running_.store(false);
    std::cout << "[RETENTION] Stopped: passes=" << passes() << " purged=" << purged()
              << " failures=" << failures() << "\n";
}
