#include "config/MonitorConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>

using namespace latmon;

static bool is_ai(ComponentClass c) {
    return c == ComponentClass::AI_MODEL_LOCAL || c == ComponentClass::AI_MODEL_REMOTE;
}

static std::chrono::milliseconds interval_for(ComponentClass c, std::chrono::milliseconds base) {
    return is_ai(c) ? base * 2 : base;
}

// "ai-model-local" -> "AI_MODEL_LOCAL"
static std::string env_suffix(ComponentClass c) {
    std::string s = to_string(c);
    for (char& ch : s) {
        ch = (ch == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return s;
}

static std::string trim(const std::string& s) {
    std::size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    std::size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

static std::optional<uint64_t> env_uint(const MonitorConfig::EnvLookup& env, const std::string& key) {
    const char* raw = env(key);
    if (!raw) return std::nullopt;
    std::string v = trim(raw);
    if (v.empty() || v.size() > 18 || v.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError(key + "='" + std::string(raw) + "' is not a non-negative integer");
    }
    return std::strtoull(v.c_str(), nullptr, 10);
}

static std::optional<std::string> env_str(const MonitorConfig::EnvLookup& env, const std::string& key) {
    const char* raw = env(key);
    if (!raw) return std::nullopt;
    return std::string(raw);
}

std::vector<SamplerSpec> latmon::default_samplers(std::chrono::milliseconds base) {
    std::vector<SamplerSpec> out;
    for (ComponentClass c : {ComponentClass::EDITOR, ComponentClass::EXTENSION_HOST,
                             ComponentClass::AI_MODEL_REMOTE, ComponentClass::AI_MODEL_LOCAL,
                             ComponentClass::TERMINAL}) {
        out.push_back(SamplerSpec{to_string(c), c, interval_for(c, base)});
    }
    return out;
}

std::string latmon::default_db_path() {
    const char* home = std::getenv("HOME");
    std::string root = (home && *home) ? std::string(home) + "/.local/share" : ".";
    return root + "/latmon/metrics.db";
}

MonitorConfig MonitorConfig::defaults() {
    MonitorConfig cfg;
    cfg.db_path  = default_db_path();
    cfg.samplers = default_samplers(cfg.base_interval);
    return cfg;
}

MonitorConfig MonitorConfig::from_environment() {
    MonitorConfig cfg = defaults();
    cfg.apply_env([](const std::string& key) { return std::getenv(key.c_str()); });
    return cfg;
}

void MonitorConfig::apply_env(const EnvLookup& env) {
    if (auto v = env_str(env, "LATMON_DB_PATH"))   db_path   = *v;
    if (auto v = env_str(env, "LATMON_HTTP_BIND")) http_bind = trim(*v);
    if (auto v = env_uint(env, "LATMON_HTTP_PORT")) {
        if (*v > 65535) throw ConfigError("LATMON_HTTP_PORT out of range: " + std::to_string(*v));
        http_port = static_cast<int>(*v);
    }
    if (auto v = env_uint(env, "LATMON_BUS_CAPACITY"))     bus_capacity = *v;
    if (auto v = env_uint(env, "LATMON_RETENTION_DAYS")) {
        if (*v > 36500) throw ConfigError("LATMON_RETENTION_DAYS out of range: " + std::to_string(*v));
        retention_days = static_cast<uint32_t>(*v);
    }
    if (auto v = env_uint(env, "LATMON_COMPACTION_INTERVAL_S")) {
        compaction_interval = std::chrono::seconds(*v);
    }
    if (auto v = env_uint(env, "LATMON_WRITE_ATTEMPTS")) {
        if (*v > 100) throw ConfigError("LATMON_WRITE_ATTEMPTS out of range: " + std::to_string(*v));
        sink.max_attempts = static_cast<uint32_t>(*v);
    }
    if (auto v = env_uint(env, "LATMON_WRITE_BACKOFF_MS"))  sink.initial_backoff = std::chrono::milliseconds(*v);
    if (auto v = env_uint(env, "LATMON_BATCH_SIZE"))        sink.batch_size = *v;
    if (auto v = env_uint(env, "LATMON_QUERY_TIMEOUT_MS"))  query_timeout = std::chrono::milliseconds(*v);
    if (auto v = env_uint(env, "LATMON_SYNTHETIC_EVENTS"))  synthetic_events = *v;

    // Sampler set: names from LATMON_SAMPLERS (or the current set), base
    // interval, then per-class overrides.
    std::vector<ComponentClass> classes;
    if (auto v = env_str(env, "LATMON_SAMPLERS")) {
        std::string list = *v;
        std::size_t pos = 0;
        while (pos <= list.size()) {
            std::size_t comma = list.find(',', pos);
            if (comma == std::string::npos) comma = list.size();
            std::string name = trim(list.substr(pos, comma - pos));
            if (!name.empty()) {
                auto c = parse_component_class(name);
                if (!c) throw ConfigError("LATMON_SAMPLERS: unknown sampler '" + name + "'");
                classes.push_back(*c);
            }
            pos = comma + 1;
        }
    } else {
        for (const auto& s : samplers) classes.push_back(s.component);
    }

    if (auto v = env_uint(env, "LATMON_INTERVAL_MS")) base_interval = std::chrono::milliseconds(*v);

    samplers.clear();
    for (ComponentClass c : classes) {
        SamplerSpec s{to_string(c), c, interval_for(c, base_interval)};
        if (auto v = env_uint(env, "LATMON_INTERVAL_" + env_suffix(c) + "_MS")) {
            s.interval = std::chrono::milliseconds(*v);
        }
        samplers.push_back(s);
    }
}

void MonitorConfig::validate() const {
    if (db_path.empty())   throw ConfigError("database path is empty");
    if (http_bind.empty()) throw ConfigError("HTTP bind address is empty");
    if (http_port < 1024 || http_port > 65535) {
        throw ConfigError("HTTP port " + std::to_string(http_port) + " must be in 1024-65535");
    }
    if (bus_capacity == 0)        throw ConfigError("bus capacity must be > 0");
    if (base_interval.count() <= 0) throw ConfigError("base sampling interval must be > 0");
    if (samplers.empty())         throw ConfigError("no samplers configured");

    std::set<std::string> seen;
    for (const auto& s : samplers) {
        if (!parse_component_class(s.name)) throw ConfigError("unknown sampler '" + s.name + "'");
        if (!seen.insert(s.name).second)    throw ConfigError("sampler '" + s.name + "' listed twice");
        if (s.interval.count() <= 0) {
            throw ConfigError("sampler '" + s.name + "': interval must be > 0");
        }
    }

    if (retention_days == 0)             throw ConfigError("retention days must be > 0");
    if (compaction_interval.count() <= 0) throw ConfigError("compaction interval must be > 0");

    if (aggregator.bounds_us.empty()) throw ConfigError("histogram bounds are empty");
    for (std::size_t i = 0; i < aggregator.bounds_us.size(); ++i) {
        if (aggregator.bounds_us[i] <= 0 ||
            (i > 0 && aggregator.bounds_us[i] <= aggregator.bounds_us[i - 1])) {
            throw ConfigError("histogram bounds must be positive and strictly increasing");
        }
    }
    if (aggregator.slices == 0)              throw ConfigError("window slices must be > 0");
    if (aggregator.slice_width.count() <= 0) throw ConfigError("window slice width must be > 0");

    if (sink.max_attempts == 0)   throw ConfigError("write attempts must be > 0");
    if (sink.batch_size == 0)     throw ConfigError("batch size must be > 0");
    if (sink.initial_backoff.count() < 0 || sink.max_backoff < sink.initial_backoff) {
        throw ConfigError("write backoff must be >= 0 and not above its cap");
    }
    if (query_timeout.count() <= 0) throw ConfigError("query timeout must be > 0");
}

void MonitorConfig::print() const {
    std::cout << "[CONFIG] db=" << db_path
              << " http=" << http_bind << ":" << http_port
              << " bus=" << bus_capacity
              << " retention=" << retention_days << "d"
              << " batch=" << sink.batch_size
              << " attempts=" << sink.max_attempts
              << " query_timeout=" << query_timeout.count() << "ms\n";
    for (const auto& s : samplers) {
        std::cout << "[CONFIG]   sampler " << s.name << " every " << s.interval.count() << "ms\n";
    }
}

// KEY=VALUE per line. Blank lines and # comments skipped, optional
// "export " prefix, surrounding quotes stripped. Existing env wins.
bool latmon::load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    std::size_t applied = 0;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.rfind("export ", 0) == 0) key = trim(key.substr(7));
        if (key.empty()) continue;

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!std::getenv(key.c_str())) {
            if (setenv(key.c_str(), value.c_str(), 0) != 0) {
                std::cerr << "[CONFIG] Could not set " << key << " from " << path << "\n";
                continue;
            }
            ++applied;
        }
    }

    std::cout << "[CONFIG] .env loaded from " << path << " (" << applied << " set)\n";
    return true;
}
