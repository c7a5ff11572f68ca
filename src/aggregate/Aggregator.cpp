#include "aggregate/Aggregator.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>

using namespace latmon;

Aggregator::Aggregator(AggregatorConfig cfg) : cfg_(std::move(cfg)) {
    for (auto& c : classes_) c = std::make_unique<ClassWindow>(cfg_);
}

Aggregator::~Aggregator() {
    join();
}

bool Aggregator::record(const LatencyEvent& event) {
    ClassWindow& cw = *classes_[index_of(event.component())];
    {
        std::unique_lock<std::shared_mutex> lk(cw.mtx);
        if (!cw.window.record(event.timestamp(), event.duration())) {
            too_old_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        if (!cw.last_updated || *cw.last_updated < event.timestamp()) {
            cw.last_updated = event.timestamp();
        }
    }
    recorded_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

PerformanceSnapshot Aggregator::snapshot(ComponentClass c, Timestamp now) const {
    const ClassWindow& cw = *classes_[index_of(c)];

    Micros span{0};
    std::optional<Timestamp> last;
    LatencyHistogram h = [&]() {
        std::shared_lock<std::shared_mutex> lk(cw.mtx);
        last = cw.last_updated;
        return cw.window.merged(now, &span);
    }();

    PerformanceSnapshot s;
    s.component      = c;
    s.count          = h.count();
    s.window_seconds = std::chrono::duration<double>(cw.window.length()).count();
    if (h.count() == 0) return s;

    s.avg_ms = h.mean_us() / 1000.0;
    s.min_ms = h.min_us() / 1000.0;
    s.max_ms = h.max_us() / 1000.0;
    s.p50_ms = h.percentile_us(0.50) / 1000.0;
    s.p95_ms = h.percentile_us(0.95) / 1000.0;
    s.p99_ms = h.percentile_us(0.99) / 1000.0;

    double secs = std::max(1.0, std::chrono::duration<double>(span).count());
    s.events_per_second = static_cast<double>(h.count()) / secs;
    s.last_updated = last;
    return s;
}

std::vector<PerformanceSnapshot> Aggregator::snapshot_all(Timestamp now) const {
    std::vector<PerformanceSnapshot> out;
    for (ComponentClass c : kAllComponentClasses) {
        PerformanceSnapshot s = snapshot(c, now);
        if (s.count > 0) out.push_back(std::move(s));
    }
    return out;
}

std::size_t Aggregator::cell_count() const {
    std::size_t cells = 0;
    for (const auto& c : classes_) {
        std::shared_lock<std::shared_mutex> lk(c->mtx);
        cells += c->window.cell_count();
    }
    return cells;
}

void Aggregator::start(std::shared_ptr<EventSubscription> sub, CancellationToken token) {
    if (running_.exchange(true)) return;
    std::cout << "[AGG] Started (" << cfg_.slices << " x "
              << std::chrono::duration_cast<std::chrono::seconds>(cfg_.slice_width).count()
              << "s window, " << cfg_.bounds_us.size() + 1 << " buckets)\n";
    worker_ = std::thread([this, sub, token]() { run(sub, token); });
}

void Aggregator::join() {
    if (worker_.joinable()) worker_.join();
}

void Aggregator::run(std::shared_ptr<EventSubscription> sub, CancellationToken token) {
    std::optional<LatencyEvent> ev;
    while (!token.forced()) {
        auto st = sub->pop(ev, std::chrono::milliseconds(100));
        if (st == EventBus::PopStatus::CLOSED) break;
        if (st == EventBus::PopStatus::TIMEOUT) continue;
        record(*ev);
    }
    running_.store(false);
    std::cout << "[AGG] Stopped: recorded=" << recorded()
              << " too_old=" << too_old() << "\n";
}
