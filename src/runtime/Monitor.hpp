#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "aggregate/Aggregator.hpp"
#include "bus/EventBus.hpp"
#include "config/MonitorConfig.hpp"
#include "query/QueryService.hpp"
#include "retention/RetentionCompactor.hpp"
#include "runtime/Cancellation.hpp"
#include "sampler/ClassificationRules.hpp"
#include "sampler/Sampler.hpp"
#include "storage/EventStore.hpp"
#include "storage/PersistenceSink.hpp"
#include "telemetry/HttpApi.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// Owner of the whole pipeline. Constructed once in main().
//
//   Samplers -> EventBus -> { PersistenceSink, Aggregator }
//   QueryService reads the sink and the aggregator; HttpApi serves it.
//   RetentionCompactor purges through the sink.
//
// open()  builds every component, opens the store and binds the listener.
//         Any failure throws before a single thread exists.
// start() subscribes the consumers, then starts the producers.
// stop()  GRACEFUL: samplers finish their tick, the bus is closed and the
//         consumers drain it. FORCED: the bus is emptied and every loop
//         exits at its next check.
//
// The CancellationSource is the only shutdown signal; every task holds a
// token copied from it.
// ---------------------------------------------------------------------------
class Monitor {
public:
    using TableFactory = std::function<std::unique_ptr<ProcessTable>()>;

    // store / tables / rules may be injected; defaults are SQLite at
    // cfg.db_path, /proc, and ClassificationRules::defaults().
    explicit Monitor(MonitorConfig cfg,
                     std::shared_ptr<EventStore> store = nullptr,
                     TableFactory tables = TableFactory(),
                     ClassificationRules rules = ClassificationRules::defaults());
    ~Monitor();

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    void open();
    void start();
    void stop(ShutdownMode mode);

    bool started() const { return started_.load(); }
    bool stopped() const { return stopped_.load(); }

    std::vector<std::string> active_samplers() const;
    void print_summary() const;

    const MonitorConfig& config() const { return cfg_; }
    std::shared_ptr<EventBus>        bus()        const { return bus_; }
    std::shared_ptr<PersistenceSink> sink()       const { return sink_; }
    std::shared_ptr<Aggregator>      aggregator() const { return aggregator_; }
    std::shared_ptr<QueryService>    query()      const { return query_; }
    std::shared_ptr<HttpApi>         http()       const { return http_; }
    const std::vector<std::unique_ptr<Sampler>>& samplers() const { return samplers_; }

private:
    MonitorConfig       cfg_;
    TableFactory        tables_;
    ClassificationRules rules_;
    CancellationSource  cancel_;

    std::shared_ptr<EventStore>         store_;
    std::shared_ptr<EventBus>           bus_;
    std::shared_ptr<PersistenceSink>    sink_;
    std::shared_ptr<Aggregator>         aggregator_;
    std::shared_ptr<RetentionCompactor> compactor_;
    std::shared_ptr<QueryService>       query_;
    std::shared_ptr<HttpApi>            http_;
    std::vector<std::unique_ptr<Sampler>> samplers_;

    std::atomic<bool> opened_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace latmon
