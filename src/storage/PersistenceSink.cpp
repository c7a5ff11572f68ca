#include "storage/PersistenceSink.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace latmon;

PersistenceSink::PersistenceSink(std::shared_ptr<EventStore> store, SinkConfig cfg)
    : store_(std::move(store)), cfg_(cfg) {
    if (!store_) throw std::invalid_argument("PersistenceSink needs a store");
    if (cfg_.batch_size == 0) throw std::invalid_argument("batch_size must be > 0");
    if (cfg_.max_attempts == 0) throw std::invalid_argument("max_attempts must be > 0");
}

PersistenceSink::~PersistenceSink() {
    join();
}

void PersistenceSink::start(std::shared_ptr<EventSubscription> sub, CancellationToken token) {
    if (running_.exchange(true)) return;
    std::cout << "[SINK] Started -> " << store_->describe()
              << " (batch=" << cfg_.batch_size << " attempts=" << cfg_.max_attempts << ")\n";
    worker_ = std::thread([this, sub, token]() { run(sub, token); });
}

void PersistenceSink::join() {
    if (worker_.joinable()) worker_.join();
}

SinkStats PersistenceSink::stats() const {
    SinkStats s;
    s.stored         = stored_.load();
    s.write_failures = write_failures_.load();
    s.dropped        = dropped_.load();
    s.batches        = batches_.load();
    return s;
}

std::optional<std::vector<int64_t>>
PersistenceSink::write_with_retry(const std::vector<LatencyEvent>& batch,
                                  const CancellationToken& token) {
    auto backoff = cfg_.initial_backoff;

    for (uint32_t attempt = 1; attempt <= cfg_.max_attempts; ++attempt) {
        try {
            auto ids = store_->append(batch);
            stored_.fetch_add(batch.size(), std::memory_order_relaxed);
            batches_.fetch_add(1, std::memory_order_relaxed);
            return ids;
        } catch (const std::exception& e) {
            // Any store exception is a failed attempt; none may reach the consumer thread.
            write_failures_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[SINK] Write of " << batch.size() << " events failed (attempt "
                      << attempt << "/" << cfg_.max_attempts << "): " << e.what() << "\n";
        }

        if (attempt == cfg_.max_attempts) break;
        if (token.forced()) break;
        // A graceful stop still backs off in full; only FORCED cuts it short.
        if (token.wait_forced_for(backoff)) break;
        backoff = std::min(backoff * 2, cfg_.max_backoff);
    }

    dropped_.fetch_add(batch.size(), std::memory_order_relaxed);
    std::cerr << "[SINK] Dropped " << batch.size() << " events ("
              << dropped_.load() << " total)\n";
    return std::nullopt;
}

std::optional<LatencyEvent> PersistenceSink::store(const LatencyEvent& event,
                                                   const CancellationToken& token) {
    std::vector<LatencyEvent> one{event};
    auto ids = write_with_retry(one, token);
    if (!ids || ids->empty()) return std::nullopt;
    return event.persisted_as(ids->front());
}

void PersistenceSink::run(std::shared_ptr<EventSubscription> sub, CancellationToken token) {
    std::vector<LatencyEvent> batch;
    batch.reserve(cfg_.batch_size);
    std::optional<LatencyEvent> ev;

    while (!token.forced()) {
        auto st = sub->pop(ev, std::chrono::milliseconds(100));
        if (st == EventBus::PopStatus::CLOSED) break;
        if (st == EventBus::PopStatus::TIMEOUT) continue;

        batch.clear();
        batch.push_back(std::move(*ev));
        sub->drain(batch, cfg_.batch_size - 1);

        write_with_retry(batch, token);
    }

    running_.store(false);
    auto s = stats();
    std::cout << "[SINK] Stopped: stored=" << s.stored << " batches=" << s.batches
              << " write_failures=" << s.write_failures << " dropped=" << s.dropped
              << (token.forced() ? " (forced)" : "") << "\n";
}

std::vector<LatencyEvent> PersistenceSink::recent(std::size_t limit,
                                                  std::optional<ComponentClass> component) {
    return store_->recent(limit, component);
}

std::vector<LatencyEvent> PersistenceSink::between(Timestamp from, Timestamp to,
                                                   std::optional<ComponentClass> component) {
    return store_->between(from, to, component);
}

uint64_t PersistenceSink::purge(Timestamp older_than) {
    return store_->purge_before(older_than);
}

uint64_t PersistenceSink::total_events() {
    return store_->count();
}

std::optional<Timestamp> PersistenceSink::last_event_time() {
    return store_->last_timestamp();
}
