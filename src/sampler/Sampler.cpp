#include "sampler/Sampler.hpp"
#include <cstdio>
#include <iostream>
#include <stdexcept>

using namespace latmon;

const char* latmon::to_string(SamplerState s) {
    switch (s) {
        case SamplerState::IDLE:        return "idle";
        case SamplerState::SCANNING:    return "scanning";
        case SamplerState::CLASSIFYING: return "classifying";
        case SamplerState::EMITTING:    return "emitting";
        case SamplerState::SLEEPING:    return "sleeping";
        case SamplerState::TERMINATED:  return "terminated";
    }
    return "idle";
}

Sampler::Sampler(std::string name,
                 ComponentClass component,
                 std::chrono::milliseconds interval,
                 std::unique_ptr<ProcessTable> table,
                 const ClassificationRules& rules,
                 std::shared_ptr<EventBus> bus)
    : name_(std::move(name)),
      component_(component),
      interval_(interval),
      table_(std::move(table)),
      rules_(rules.for_component(component)),
      bus_(std::move(bus)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("sampler '" + name_ + "': interval must be > 0");
    }
    if (!table_ || !bus_) {
        throw std::invalid_argument("sampler '" + name_ + "': table and bus are required");
    }
}

Sampler::~Sampler() {
    join();
}

void Sampler::start(CancellationToken token) {
    if (running_.exchange(true)) return;
    std::cout << "[SAMPLER] " << name_ << " started (class=" << to_string(component_)
              << " interval=" << interval_.count() << "ms rules=" << rules_.size()
              << " table=" << table_->name() << ")\n";
    worker_ = std::thread([this, token]() { run(token); });
}

void Sampler::join() {
    if (worker_.joinable()) worker_.join();
}

SamplerStats Sampler::stats() const {
    SamplerStats s;
    s.ticks         = ticks_.load();
    s.scan_failures = scan_failures_.load();
    s.matched       = matched_.load();
    s.published     = published_.load();
    s.rejected      = rejected_.load();
    return s;
}

Timestamp Sampler::next_timestamp() {
    Timestamp now = wall_now();
    if (now < last_ts_) now = last_ts_;   // wall clock stepped back
    last_ts_ = now;
    return now;
}

std::size_t Sampler::tick() {
    ticks_.fetch_add(1, std::memory_order_relaxed);

    state_.store(SamplerState::SCANNING);
    const auto scan_start = std::chrono::steady_clock::now();

    if (!table_->snapshot(procs_)) {
        uint64_t n = scan_failures_.fetch_add(1) + 1;
        std::cerr << "[SAMPLER] " << name_ << ": process table unreadable, tick skipped"
                  << " (failures=" << n << ")\n";
        return 0;
    }

    state_.store(SamplerState::CLASSIFYING);
    std::vector<std::pair<const ProcessInfo*, const ClassificationRule*>> hits;
    for (const auto& p : procs_) {
        if (const ClassificationRule* r = rules_.match(p)) hits.emplace_back(&p, r);
    }
    matched_.fetch_add(hits.size(), std::memory_order_relaxed);

    state_.store(SamplerState::EMITTING);
    std::size_t sent = 0;
    for (const auto& hit : hits) {
        const ProcessInfo& p = *hit.first;
        const ClassificationRule& r = *hit.second;

        auto elapsed = std::chrono::duration_cast<Micros>(
            std::chrono::steady_clock::now() - scan_start);

        char desc[256];
        std::snprintf(desc, sizeof(desc), "Process %d (%s) - CPU: %.1f%%, Memory: %lluKB",
                      p.pid, p.name.c_str(), p.cpu_percent,
                      static_cast<unsigned long long>(p.memory_kb));

        nlohmann::json meta{
            {"pid",         p.pid},
            {"name",        p.name},
            {"cpu_percent", p.cpu_percent},
            {"memory_kb",   p.memory_kb},
            {"rule",        r.label},
            {"sampler",     name_},
        };

        LatencyEvent ev(next_timestamp(), component_, r.source, elapsed, desc, std::move(meta));
        if (bus_->publish(ev)) {
            ++sent;
        } else {
            rejected_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    published_.fetch_add(sent, std::memory_order_relaxed);
    return sent;
}

void Sampler::run(CancellationToken token) {
    state_.store(SamplerState::IDLE);

    while (!token.cancelled()) {
        try {
            tick();
        } catch (const std::exception& e) {
            scan_failures_.fetch_add(1);
            std::cerr << "[SAMPLER] " << name_ << ": tick failed: " << e.what() << "\n";
        }

        state_.store(SamplerState::SLEEPING);
        if (token.wait_for(interval_)) break;
    }

    state_.store(SamplerState::TERMINATED);
    running_.store(false);

    auto s = stats();
    std::cout << "[SAMPLER] " << name_ << " stopped: ticks=" << s.ticks
              << " published=" << s.published << " rejected=" << s.rejected
              << " scan_failures=" << s.scan_failures << "\n";
}
