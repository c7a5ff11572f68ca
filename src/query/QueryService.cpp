#include "query/QueryService.hpp"
#include <boost/asio/post.hpp>
#include <iostream>
#include <sstream>

using namespace latmon;
using json = nlohmann::json;

const char* latmon::to_string(QueryErrorKind k) {
    switch (k) {
        case QueryErrorKind::STORE_UNAVAILABLE:      return "store-unavailable";
        case QueryErrorKind::AGGREGATOR_UNAVAILABLE: return "aggregator-unavailable";
        case QueryErrorKind::TIMEOUT:                return "timeout";
    }
    return "store-unavailable";
}

void latmon::to_json(json& j, const HealthInfo& h) {
    j = json{
        {"status",    h.status},
        {"timestamp", format_iso8601(h.timestamp)},
        {"version",   h.version},
    };
}

QueryService::QueryService(std::shared_ptr<PersistenceSink> sink,
                           std::shared_ptr<Aggregator> aggregator,
                           std::shared_ptr<EventBus> bus,
                           SamplerList active_samplers,
                           std::chrono::milliseconds timeout,
                           std::size_t threads)
    : sink_(std::move(sink)),
      aggregator_(std::move(aggregator)),
      bus_(std::move(bus)),
      active_samplers_(std::move(active_samplers)),
      timeout_(timeout),
      pool_(threads == 0 ? 1 : threads) {
    if (timeout_.count() <= 0) throw std::invalid_argument("query timeout must be > 0");
}

QueryService::~QueryService() {
    pool_.join();
}

template <typename F>
std::future<decltype(std::declval<F&>()())> QueryService::submit(F fn) {
    using R = decltype(fn());
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> fut = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return fut;
}

template <typename T>
T QueryService::await(std::future<T>& fut, std::chrono::steady_clock::time_point deadline,
                      QueryErrorKind on_error, const char* what) {
    if (fut.wait_until(deadline) != std::future_status::ready) {
        throw QueryError(QueryErrorKind::TIMEOUT,
                         std::string(what) + " timed out after " +
                         std::to_string(timeout_.count()) + "ms");
    }
    try {
        return fut.get();
    } catch (const QueryError&) {
        throw;
    } catch (const std::exception& e) {
        throw QueryError(on_error, std::string(what) + " failed: " + e.what());
    }
}

std::vector<LatencyEvent> QueryService::recent_events(std::size_t limit,
                                                      std::optional<ComponentClass> component) {
    if (!sink_) throw QueryError(QueryErrorKind::STORE_UNAVAILABLE, "no event store");

    auto sink = sink_;
    auto fut = submit([sink, limit, component]() { return sink->recent(limit, component); });
    return await(fut, std::chrono::steady_clock::now() + timeout_,
                 QueryErrorKind::STORE_UNAVAILABLE, "recent events");
}

std::vector<PerformanceSnapshot> QueryService::metrics() {
    if (!aggregator_) throw QueryError(QueryErrorKind::AGGREGATOR_UNAVAILABLE, "no aggregator");

    auto agg = aggregator_;
    auto fut = submit([agg]() { return agg->snapshot_all(); });
    return await(fut, std::chrono::steady_clock::now() + timeout_,
                 QueryErrorKind::AGGREGATOR_UNAVAILABLE, "metrics snapshot");
}

HealthInfo QueryService::health() const {
    return HealthInfo{"healthy", wall_now(), LATMON_VERSION};
}

HostResources QueryService::system_resources() const {
    return host_.sample();
}

namespace {
struct StoreFigures {
    uint64_t total;
    std::optional<Timestamp> last;
};
}

SystemStatus QueryService::status() {
    SystemStatus s;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    // Both reads in flight at once; they share one deadline.
    std::optional<std::future<StoreFigures>> store_fut;
    std::optional<std::future<std::vector<PerformanceSnapshot>>> agg_fut;

    if (sink_) {
        auto sink = sink_;
        store_fut = submit([sink]() { return StoreFigures{sink->total_events(), sink->last_event_time()}; });
    } else {
        s.degraded.push_back("store-unavailable: no event store");
    }
    if (aggregator_) {
        auto agg = aggregator_;
        agg_fut = submit([agg]() { return agg->snapshot_all(); });
    } else {
        s.degraded.push_back("aggregator-unavailable: no aggregator");
    }

    if (store_fut) {
        try {
            StoreFigures f = await(*store_fut, deadline, QueryErrorKind::STORE_UNAVAILABLE, "store totals");
            s.total_events    = f.total;
            s.last_event_time = f.last;
        } catch (const QueryError& e) {
            s.degraded.push_back(std::string(to_string(e.kind())) + ": " + e.what());
        }
    }
    if (agg_fut) {
        try {
            s.metrics = await(*agg_fut, deadline, QueryErrorKind::AGGREGATOR_UNAVAILABLE, "metrics snapshot");
        } catch (const QueryError& e) {
            s.degraded.push_back(std::string(to_string(e.kind())) + ": " + e.what());
        }
    }

    if (active_samplers_) s.active_samplers = active_samplers_();
    s.resources = probe_.sample();
    if (bus_) s.bus_dropped = bus_->dropped();
    if (sink_) {
        SinkStats st = sink_->stats();
        s.persisted      = st.stored;
        s.write_failures = st.write_failures;
        s.write_drops    = st.dropped;
    }

    std::ostringstream sum;
    sum << "Monitoring " << s.active_samplers.size() << " samplers";
    if (s.total_events) sum << ", " << *s.total_events << " events stored";
    sum << ", " << s.bus_dropped << " dropped";
    if (!s.degraded.empty()) sum << " (degraded)";
    s.summary = sum.str();

    if (!s.degraded.empty()) {
        for (const auto& d : s.degraded) std::cerr << "[QUERY] Status degraded: " << d << "\n";
    }
    return s;
}
