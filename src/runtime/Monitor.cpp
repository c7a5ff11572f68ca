#include "runtime/Monitor.hpp"
#include <iostream>

#include "probe/SyntheticLoad.hpp"
#include "storage/SqliteEventStore.hpp"

using namespace latmon;

Monitor::Monitor(MonitorConfig cfg,
                 std::shared_ptr<EventStore> store,
                 TableFactory tables,
                 ClassificationRules rules)
    : cfg_(std::move(cfg)),
      tables_(std::move(tables)),
      rules_(std::move(rules)),
      store_(std::move(store)) {
    if (!tables_) {
        tables_ = []() { return std::make_unique<ProcFsProcessTable>(); };
    }
}

Monitor::~Monitor() {
    if (started_.load() && !stopped_.load()) stop(ShutdownMode::FORCED);
}

void Monitor::open() {
    if (opened_.exchange(true)) return;

    if (!store_) store_ = std::make_shared<SqliteEventStore>(cfg_.db_path);

    bus_        = std::make_shared<EventBus>(cfg_.bus_capacity);
    sink_       = std::make_shared<PersistenceSink>(store_, cfg_.sink);
    aggregator_ = std::make_shared<Aggregator>(cfg_.aggregator);
    compactor_  = std::make_shared<RetentionCompactor>(sink_, cfg_.retention_days,
                                                       cfg_.compaction_interval);

    for (const auto& spec : cfg_.samplers) {
        samplers_.push_back(std::make_unique<Sampler>(
            spec.name, spec.component, spec.interval, tables_(), rules_, bus_));
    }

    query_ = std::make_shared<QueryService>(
        sink_, aggregator_, bus_,
        [this]() { return active_samplers(); },
        cfg_.query_timeout);

    http_ = std::make_shared<HttpApi>(query_, cfg_.http_bind, static_cast<uint16_t>(cfg_.http_port));
    http_->bind();
}

void Monitor::start() {
    if (!opened_.load()) throw std::logic_error("Monitor::start before open");
    if (started_.exchange(true)) return;

    CancellationToken token = cancel_.token();

    // Consumers subscribe before any producer runs.
    sink_->start(bus_->subscribe("persistence"), token);
    aggregator_->start(bus_->subscribe("aggregator"), token);
    compactor_->start(token);
    http_->start(token);

    for (auto& s : samplers_) s->start(token);

    if (cfg_.synthetic_events > 0) {
        std::size_t n = publish_synthetic(*bus_, ComponentClass::SYSTEM, cfg_.synthetic_events,
                                          uniform_durations(std::chrono::milliseconds(1),
                                                            std::chrono::milliseconds(1000),
                                                            cfg_.synthetic_events));
        std::cout << "[LATMON] Published " << n << " synthetic events\n";
    }

    std::cout << "[LATMON] Running: " << samplers_.size() << " samplers, http on "
              << cfg_.http_bind << ":" << http_->port() << "\n";
}

void Monitor::stop(ShutdownMode mode) {
    if (!started_.load()) return;

    // Safe to call again from another thread while a graceful stop is
    // draining: that call only escalates.
    cancel_.cancel(mode);
    if (mode == ShutdownMode::FORCED) bus_->close_and_discard();
    if (stopped_.exchange(true)) return;

    std::cout << "[LATMON] Stopping (" << to_string(mode) << ")\n";

    // Producers first: nothing is published after this point.
    for (auto& s : samplers_) s->join();

    if (cancel_.token().forced()) bus_->close_and_discard();
    else                          bus_->close();

    sink_->join();
    aggregator_->join();
    compactor_->join();
    http_->join();

    std::cout << "[LATMON] Stopped\n";
}

std::vector<std::string> Monitor::active_samplers() const {
    std::vector<std::string> names;
    for (const auto& s : samplers_) {
        if (s->running()) names.push_back(s->name());
    }
    return names;
}

void Monitor::print_summary() const {
    std::cout << "\n[LATMON] ===== SUMMARY =====\n";
    if (bus_) {
        std::cout << "[LATMON] bus: published=" << bus_->published()
                  << " dropped=" << bus_->dropped()
                  << " rejected_closed=" << bus_->rejected_closed() << "\n";
    }
    for (const auto& s : samplers_) {
        auto st = s->stats();
        std::cout << "[LATMON] sampler " << s->name() << ": ticks=" << st.ticks
                  << " matched=" << st.matched << " published=" << st.published
                  << " rejected=" << st.rejected << " scan_failures=" << st.scan_failures << "\n";
    }
    if (sink_) {
        auto st = sink_->stats();
        std::cout << "[LATMON] sink: stored=" << st.stored << " write_failures=" << st.write_failures
                  << " dropped=" << st.dropped << "\n";
    }
    if (aggregator_) {
        for (const auto& snap : aggregator_->snapshot_all()) {
            std::cout << "[LATMON] " << to_string(snap.component) << ": n=" << snap.count
                      << " avg=" << snap.avg_ms << "ms p50=" << snap.p50_ms
                      << "ms p95=" << snap.p95_ms << "ms p99=" << snap.p99_ms << "ms\n";
        }
    }
    if (compactor_) {
        std::cout << "[LATMON] retention: passes=" << compactor_->passes()
                  << " purged=" << compactor_->purged() << "\n";
    }
}
