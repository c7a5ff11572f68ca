#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <boost/beast/http.hpp>

#include "query/QueryService.hpp"
#include "runtime/Cancellation.hpp"

namespace latmon {

// ---------------------------------------------------------------------------
// JSON read API over QueryService.
//
//   GET /status                              SystemStatus
//   GET /events?limit=N[&component=<class>]  recent events, newest first
//   GET /metrics                             PerformanceSnapshot per class
//   GET /health                              liveness only
//   GET /system/resources                    host memory, CPUs, load, uptime
//   GET /telemetry                           status, recent events and metrics
//
// Each route is also served under /api. Unknown route 404, bad parameter
// 400, QueryError 503 with {"error", "kind"}.
//
// bind() opens the listener and throws if the address cannot be bound, so
// the failure surfaces before any worker starts. The accept loop is
// synchronous and non-blocking (50ms poll) and serves one request per
// connection. A connection that has not been read and answered within 2s,
// or is still open when the token is cancelled, is shut down so that a
// silent client cannot hold the loop or delay join().
// ---------------------------------------------------------------------------
class HttpApi {
public:
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    static constexpr std::size_t kDefaultLimit    = 100;
    static constexpr std::size_t kMaxLimit        = 10000;
    static constexpr std::size_t kTelemetryEvents = 100;

    HttpApi(std::shared_ptr<QueryService> query, std::string bind_address, uint16_t port);
    ~HttpApi();

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    void bind();
    void start(CancellationToken token);
    void join();

    // Routing and rendering only; no socket involved.
    Response handle(const Request& req);

    uint16_t port() const { return port_; }
    uint64_t requests_served() const { return served_.load(); }

private:
    struct Listener;

    void run(CancellationToken token);
    nlohmann::json telemetry();

    std::shared_ptr<QueryService> query_;
    std::string bind_address_;
    uint16_t    port_;

    std::unique_ptr<Listener> listener_;
    std::thread               worker_;
    std::atomic<uint64_t>     served_{0};
};

} // namespace latmon
