#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>

#include "aggregate/Aggregator.hpp"
#include "bus/EventBus.hpp"
#include "query/HostStats.hpp"
#include "query/ResourceProbe.hpp"
#include "storage/PersistenceSink.hpp"

#ifndef LATMON_VERSION
#define LATMON_VERSION "0.0.0"
#endif

namespace latmon {

enum class QueryErrorKind {
    STORE_UNAVAILABLE,
    AGGREGATOR_UNAVAILABLE,
    TIMEOUT,
};

// "store-unavailable", "aggregator-unavailable", "timeout"
const char* to_string(QueryErrorKind k);

class QueryError : public std::runtime_error {
public:
    QueryError(QueryErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    QueryErrorKind kind() const { return kind_; }

private:
    QueryErrorKind kind_;
};

struct HealthInfo {
    std::string status;
    Timestamp   timestamp;
    std::string version;
};

void to_json(nlohmann::json& j, const HealthInfo& h);

// ---------------------------------------------------------------------------
// Read-only facade over the pipeline.
//
// Every store or aggregator read runs on a small worker pool and is awaited
// for at most `timeout`. A read that is late or throws becomes a QueryError
// for the single-purpose views (recent_events, metrics) and a degradation
// note in status(). A missing collaborator (null handle) counts as
// unavailable. A late read is abandoned, not cancelled; it finishes on the
// pool and its result is discarded.
//
// health() and system_resources() touch neither store nor aggregator.
// ---------------------------------------------------------------------------
class QueryService {
public:
    using SamplerList = std::function<std::vector<std::string>()>;

    QueryService(std::shared_ptr<PersistenceSink> sink,
                 std::shared_ptr<Aggregator> aggregator,
                 std::shared_ptr<EventBus> bus,
                 SamplerList active_samplers,
                 std::chrono::milliseconds timeout,
                 std::size_t threads = 2);
    ~QueryService();

    QueryService(const QueryService&) = delete;
    QueryService& operator=(const QueryService&) = delete;

    SystemStatus status();
    std::vector<LatencyEvent> recent_events(std::size_t limit,
                                            std::optional<ComponentClass> component = std::nullopt);
    std::vector<PerformanceSnapshot> metrics();
    HealthInfo health() const;
    HostResources system_resources() const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    template <typename F>
    std::future<decltype(std::declval<F&>()())> submit(F fn);

    template <typename T>
    T await(std::future<T>& fut, std::chrono::steady_clock::time_point deadline,
            QueryErrorKind on_error, const char* what);

    std::shared_ptr<PersistenceSink> sink_;
    std::shared_ptr<Aggregator>      aggregator_;
    std::shared_ptr<EventBus>        bus_;
    SamplerList                      active_samplers_;
    std::chrono::milliseconds        timeout_;

    ResourceProbe             probe_;
    HostStats                 host_;
    boost::asio::thread_pool  pool_;
};

} // namespace latmon
