#include "telemetry/HttpApi.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <sys/socket.h>

using namespace latmon;
namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp  = asio::ip::tcp;
using json = nlohmann::json;

struct HttpApi::Listener {
    asio::io_context ioc;
    tcp::acceptor    acceptor{ioc};
};

namespace {

constexpr auto kConnectionTimeout = std::chrono::seconds(2);

// Watchdog for one connection. Unless finish() is called first, the socket is
// shut down once the timeout passes or the token is cancelled, which fails any
// blocked read or write on it.
class ConnectionDeadline {
public:
    ConnectionDeadline(tcp::socket& socket, const CancellationToken& token)
        : thread_([this, &socket, token]() { watch(socket, token); }) {}

    ~ConnectionDeadline() { finish(); }

    ConnectionDeadline(const ConnectionDeadline&) = delete;
    ConnectionDeadline& operator=(const ConnectionDeadline&) = delete;

    void finish() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool expired() const { return expired_.load(); }

private:
    void watch(tcp::socket& socket, const CancellationToken& token) {
        const auto deadline = std::chrono::steady_clock::now() + kConnectionTimeout;
        std::unique_lock<std::mutex> lk(mtx_);
        while (!done_) {
            if (token.cancelled() || std::chrono::steady_clock::now() >= deadline) {
                expired_.store(true);
                // Only the fd is touched here; the socket object stays with the loop.
                if (::shutdown(socket.native_handle(), SHUT_RDWR) != 0) {
                    std::cerr << "[HTTP] Could not shut down stalled connection\n";
                }
                return;
            }
            cv_.wait_for(lk, std::chrono::milliseconds(50));
        }
    }

    std::mutex              mtx_;
    std::condition_variable cv_;
    bool                    done_{false};
    std::atomic<bool>       expired_{false};
    std::thread             thread_;
};

struct BadRequest {
    std::string message;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& q) {
    std::map<std::string, std::string> out;
    std::size_t pos = 0;
    while (pos <= q.size()) {
        std::size_t amp = q.find('&', pos);
        if (amp == std::string::npos) amp = q.size();
        std::string pair = q.substr(pos, amp - pos);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            if (eq == std::string::npos) out[url_decode(pair)] = "";
            else out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
        pos = amp + 1;
    }
    return out;
}

std::size_t parse_limit(const std::map<std::string, std::string>& params) {
    auto it = params.find("limit");
    if (it == params.end()) return HttpApi::kDefaultLimit;

    const std::string& v = it->second;
    if (v.empty() || v.size() > 9 || v.find_first_not_of("0123456789") != std::string::npos) {
        throw BadRequest{"limit must be an integer between 0 and " +
                         std::to_string(HttpApi::kMaxLimit)};
    }
    std::size_t n = std::stoul(v);
    if (n > HttpApi::kMaxLimit) {
        throw BadRequest{"limit must not exceed " + std::to_string(HttpApi::kMaxLimit)};
    }
    return n;
}

std::optional<ComponentClass> parse_component(const std::map<std::string, std::string>& params) {
    auto it = params.find("component");
    if (it == params.end() || it->second.empty()) return std::nullopt;
    auto c = parse_component_class(it->second);
    if (!c) throw BadRequest{"unknown component class '" + it->second + "'"};
    return c;
}

} // namespace

HttpApi::HttpApi(std::shared_ptr<QueryService> query, std::string bind_address, uint16_t port)
    : query_(std::move(query)), bind_address_(std::move(bind_address)), port_(port) {
    if (!query_) throw std::invalid_argument("HttpApi needs a QueryService");
}

HttpApi::~HttpApi() {
    join();
}

void HttpApi::bind() {
    auto l = std::make_unique<Listener>();
    beast::error_code ec;

    auto addr = asio::ip::make_address(bind_address_, ec);
    if (ec) throw std::runtime_error("invalid bind address '" + bind_address_ + "': " + ec.message());

    tcp::endpoint ep(addr, port_);
    l->acceptor.open(ep.protocol(), ec);
    if (!ec) l->acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) l->acceptor.bind(ep, ec);
    if (!ec) l->acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (!ec) l->acceptor.non_blocking(true, ec);
    if (ec) {
        throw std::runtime_error("cannot listen on " + bind_address_ + ":" +
                                 std::to_string(port_) + ": " + ec.message());
    }

    port_ = l->acceptor.local_endpoint().port();
    listener_ = std::move(l);
    std::cout << "[HTTP] Listening on " << bind_address_ << ":" << port_ << "\n";
}

void HttpApi::start(CancellationToken token) {
    if (!listener_) throw std::logic_error("HttpApi::start before bind");
    if (worker_.joinable()) return;
    worker_ = std::thread([this, token]() { run(token); });
}

void HttpApi::join() {
    if (worker_.joinable()) worker_.join();
}

HttpApi::Response HttpApi::handle(const Request& req) {
    Response res;
    res.version(req.version());
    res.keep_alive(false);
    res.set(http::field::server, "latmon/" LATMON_VERSION);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");

    auto reply = [&](http::status st, const json& body) {
        res.result(st);
        res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
        res.prepare_payload();
        return res;
    };

    if (req.method() != http::verb::get) {
        res.set(http::field::allow, "GET");
        return reply(http::status::method_not_allowed, json{{"error", "only GET is supported"}});
    }

    std::string target(req.target());
    std::string path = target, query;
    std::size_t qpos = target.find('?');
    if (qpos != std::string::npos) {
        path  = target.substr(0, qpos);
        query = target.substr(qpos + 1);
    }
    if (path.rfind("/api/", 0) == 0) path = path.substr(4);
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    try {
        if (path == "/health") {
            return reply(http::status::ok, query_->health());
        }
        if (path == "/status") {
            return reply(http::status::ok, query_->status());
        }
        if (path == "/metrics") {
            return reply(http::status::ok, query_->metrics());
        }
        if (path == "/system/resources") {
            return reply(http::status::ok, query_->system_resources());
        }
        if (path == "/telemetry") {
            return reply(http::status::ok, telemetry());
        }
        if (path == "/events") {
            auto params = parse_query(query);
            std::size_t limit = parse_limit(params);
            auto component = parse_component(params);
            return reply(http::status::ok, query_->recent_events(limit, component));
        }
        return reply(http::status::not_found, json{{"error", "no route for " + path}});
    } catch (const BadRequest& e) {
        return reply(http::status::bad_request, json{{"error", e.message}});
    } catch (const QueryError& e) {
        std::cerr << "[HTTP] " << path << ": " << e.what() << "\n";
        return reply(http::status::service_unavailable,
                     json{{"error", e.what()}, {"kind", to_string(e.kind())}});
    }
}

// A failed events or metrics read fails the whole view, as on their own routes.
json HttpApi::telemetry() {
    SystemStatus status = query_->status();
    auto events  = query_->recent_events(kTelemetryEvents);
    auto metrics = query_->metrics();
    return json{
        {"service",             "latmon"},
        {"version",             LATMON_VERSION},
        {"timestamp",           format_iso8601(wall_now())},
        {"bind_address",        bind_address_},
        {"system_status",       status},
        {"recent_events",       events},
        {"performance_metrics", metrics},
        {"telemetry_metadata", {
            {"api_version",   "v1"},
            {"cors_enabled",  true},
            {"recent_events", kTelemetryEvents},
        }},
    };
}

void HttpApi::run(CancellationToken token) {
    auto& ioc      = listener_->ioc;
    auto& acceptor = listener_->acceptor;

    while (!token.cancelled()) {
        tcp::socket socket(ioc);
        beast::error_code ec;
        acceptor.accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            std::cerr << "[HTTP] Accept failed: " << ec.message() << "\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        // The listener is non-blocking; the connection must not be.
        socket.non_blocking(false, ec);
        if (ec) {
            std::cerr << "[HTTP] Could not switch connection to blocking: " << ec.message() << "\n";
            continue;
        }

        ConnectionDeadline deadline(socket, token);

        beast::flat_buffer buffer;
        Request req;
        http::read(socket, buffer, req, ec);
        if (ec) {
            if (deadline.expired()) {
                std::cerr << "[HTTP] Closing connection with no complete request after "
                          << kConnectionTimeout.count() << "s\n";
            } else {
                std::cerr << "[HTTP] Dropping malformed request: " << ec.message() << "\n";
            }
            continue;
        }

        Response res = handle(req);
        http::write(socket, res, ec);
        if (ec) {
            std::cerr << "[HTTP] Write failed: " << ec.message() << "\n";
            continue;
        }
        deadline.finish();
        socket.shutdown(tcp::socket::shutdown_send, ec);
        served_.fetch_add(1, std::memory_order_relaxed);
    }

    beast::error_code ec;
    acceptor.close(ec);
    std::cout << "[HTTP] Stopped: requests=" << served_.load() << "\n";
}
