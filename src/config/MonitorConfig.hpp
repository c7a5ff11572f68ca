#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "aggregate/Aggregator.hpp"
#include "model/Types.hpp"
#include "storage/PersistenceSink.hpp"

namespace latmon {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SamplerSpec {
    std::string               name;
    ComponentClass            component{ComponentClass::SYSTEM};
    std::chrono::milliseconds interval{1000};
};

// ---------------------------------------------------------------------------
// Everything the daemon needs to start.
//
// Precedence: compiled defaults < .env file < process environment. The
// .env loader only fills variables that are not already set, so
// apply_env() sees the merged view.
//
// LATMON_DB_PATH            database file
// LATMON_HTTP_BIND          listen address            (127.0.0.1)
// LATMON_HTTP_PORT          listen port               (3030)
// LATMON_BUS_CAPACITY       per-subscriber slots      (10000)
// LATMON_INTERVAL_MS        base sampling interval    (1000)
// LATMON_INTERVAL_<C>_MS    per class, e.g. LATMON_INTERVAL_AI_MODEL_LOCAL_MS
// LATMON_SAMPLERS           comma list of classes     (editor,extension-host,
//                                                      ai-model-remote,
//                                                      ai-model-local,terminal)
// LATMON_RETENTION_DAYS     (30)
// LATMON_COMPACTION_INTERVAL_S (86400)
// LATMON_WRITE_ATTEMPTS     (3)
// LATMON_WRITE_BACKOFF_MS   first retry delay         (50)
// LATMON_BATCH_SIZE         (64)
// LATMON_QUERY_TIMEOUT_MS   (2000)
// LATMON_SYNTHETIC_EVENTS   self-test events at start (0)
// ---------------------------------------------------------------------------
struct MonitorConfig {
    using EnvLookup = std::function<const char*(const std::string&)>;

    std::string db_path;
    std::string http_bind{"127.0.0.1"};
    int         http_port{3030};

    std::size_t               bus_capacity{10000};
    std::chrono::milliseconds base_interval{1000};
    std::vector<SamplerSpec>  samplers;

    uint32_t             retention_days{30};
    std::chrono::seconds compaction_interval{std::chrono::hours(24)};

    AggregatorConfig aggregator;
    SinkConfig       sink;

    std::chrono::milliseconds query_timeout{2000};
    std::size_t               synthetic_events{0};

    // Defaults, with the standard sampler set at base_interval.
    static MonitorConfig defaults();

    // defaults() + apply_env(getenv). Throws ConfigError on malformed values.
    static MonitorConfig from_environment();

    void apply_env(const EnvLookup& env);

    // Throws ConfigError naming the first offending setting.
    void validate() const;

    void print() const;
};

// Standard set: editor, extension host, remote and local AI (at twice the
// base interval) and terminal.
std::vector<SamplerSpec> default_samplers(std::chrono::milliseconds base);

// ~/.local/share/latmon/metrics.db, or ./latmon/metrics.db without $HOME.
std::string default_db_path();

// Reads KEY=VALUE lines into the environment without overriding anything
// already set. Returns false if the file could not be opened.
bool load_dotenv(const std::string& path);

} // namespace latmon
