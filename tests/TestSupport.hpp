#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "model/LatencyEvent.hpp"
#include "sampler/ProcessTable.hpp"
#include "storage/EventStore.hpp"

namespace latmon {
namespace test {

// 2026-01-01T00:00:00Z
inline Timestamp base_time() {
    return from_micros(1767225600LL * 1000000LL);
}

inline LatencyEvent make_event(Timestamp ts, ComponentClass c, double duration_ms,
                               SourceKind src = SourceKind::SYNTHETIC_TEST) {
    return LatencyEvent(ts, c, src, Micros(static_cast<int64_t>(duration_ms * 1000.0)),
                        "test event");
}

// Scripted process table. Thread-safe so tests can flip it while a
// sampler thread is polling.
class FakeProcessTable : public ProcessTable {
public:
    explicit FakeProcessTable(std::vector<ProcessInfo> procs = {}) : procs_(std::move(procs)) {}

    bool snapshot(std::vector<ProcessInfo>& out) override {
        calls_.fetch_add(1);
        std::lock_guard<std::mutex> lk(mtx_);
        out.clear();
        if (failing_) return false;
        out = procs_;
        return true;
    }
    const char* name() const override { return "fake"; }

    void set_failing(bool f) {
        std::lock_guard<std::mutex> lk(mtx_);
        failing_ = f;
    }
    void set_processes(std::vector<ProcessInfo> p) {
        std::lock_guard<std::mutex> lk(mtx_);
        procs_ = std::move(p);
    }
    uint64_t calls() const { return calls_.load(); }

private:
    std::mutex mtx_;
    std::vector<ProcessInfo> procs_;
    bool failing_{false};
    std::atomic<uint64_t> calls_{0};
};

inline ProcessInfo proc(int32_t pid, std::string name, std::string cmdline = "",
                        double cpu = 1.0, uint64_t mem_kb = 2048) {
    ProcessInfo p;
    p.pid = pid;
    p.name = std::move(name);
    p.cmdline = std::move(cmdline);
    p.cpu_percent = cpu;
    p.memory_kb = mem_kb;
    return p;
}

// In-memory EventStore with injectable faults and latency.
class MemoryEventStore : public EventStore {
public:
    std::vector<int64_t> append(const std::vector<LatencyEvent>& batch) override {
        pause();
        std::lock_guard<std::mutex> lk(mtx_);
        append_calls_++;
        if (fail_appends_ != 0) {
            if (fail_appends_ != kAlways) fail_appends_--;
            throw StoreError("injected write failure");
        }
        std::vector<int64_t> ids;
        for (const auto& ev : batch) {
            rows_.push_back(ev.persisted_as(next_id_));
            ids.push_back(next_id_++);
        }
        return ids;
    }

    std::vector<LatencyEvent> recent(std::size_t limit,
                                     std::optional<ComponentClass> component) override {
        pause();
        std::lock_guard<std::mutex> lk(mtx_);
        check_reads();
        std::vector<LatencyEvent> out;
        for (const auto& r : rows_) {
            if (!component || r.component() == *component) out.push_back(r);
        }
        std::stable_sort(out.begin(), out.end(), [](const LatencyEvent& a, const LatencyEvent& b) {
            if (a.timestamp() != b.timestamp()) return a.timestamp() > b.timestamp();
            return *a.id() > *b.id();
        });
        if (out.size() > limit) out.erase(out.begin() + static_cast<std::ptrdiff_t>(limit), out.end());
        return out;
    }

    std::vector<LatencyEvent> between(Timestamp from, Timestamp to,
                                      std::optional<ComponentClass> component) override {
        pause();
        std::lock_guard<std::mutex> lk(mtx_);
        check_reads();
        std::vector<LatencyEvent> out;
        for (const auto& r : rows_) {
            if (r.timestamp() >= from && r.timestamp() < to &&
                (!component || r.component() == *component)) {
                out.push_back(r);
            }
        }
        return out;
    }

    uint64_t purge_before(Timestamp cutoff) override {
        std::lock_guard<std::mutex> lk(mtx_);
        if (fail_purge_) throw StoreError("injected purge failure");
        auto before = rows_.size();
        rows_.erase(std::remove_if(rows_.begin(), rows_.end(),
                                   [&](const LatencyEvent& e) { return e.timestamp() < cutoff; }),
                    rows_.end());
        return before - rows_.size();
    }

    uint64_t count() override {
        pause();
        std::lock_guard<std::mutex> lk(mtx_);
        check_reads();
        return rows_.size();
    }

    std::optional<Timestamp> last_timestamp() override {
        pause();
        std::lock_guard<std::mutex> lk(mtx_);
        check_reads();
        std::optional<Timestamp> last;
        for (const auto& r : rows_) {
            if (!last || r.timestamp() > *last) last = r.timestamp();
        }
        return last;
    }

    std::string describe() const override { return "memory"; }

    static constexpr int kAlways = -1;

    void fail_next_appends(int n) { std::lock_guard<std::mutex> lk(mtx_); fail_appends_ = n; }
    void fail_reads(bool f)       { std::lock_guard<std::mutex> lk(mtx_); fail_reads_ = f; }
    void fail_purge(bool f)       { std::lock_guard<std::mutex> lk(mtx_); fail_purge_ = f; }
    void set_delay(std::chrono::milliseconds d) { delay_ms_.store(d.count()); }

    std::size_t size() { std::lock_guard<std::mutex> lk(mtx_); return rows_.size(); }
    int append_calls() { std::lock_guard<std::mutex> lk(mtx_); return append_calls_; }

private:
    void pause() const {
        auto d = delay_ms_.load();
        if (d > 0) std::this_thread::sleep_for(std::chrono::milliseconds(d));
    }
    void check_reads() const {
        if (fail_reads_) throw StoreError("injected read failure");
    }

    std::mutex mtx_;
    std::vector<LatencyEvent> rows_;
    int64_t next_id_{1};
    int  fail_appends_{0};
    bool fail_reads_{false};
    bool fail_purge_{false};
    int  append_calls_{0};
    std::atomic<int64_t> delay_ms_{0};
};

// Unique scratch directory, removed on destruction.
class TempDir {
public:
    TempDir() {
        auto base = std::filesystem::temp_directory_path();
        static std::atomic<int> seq{0};
        path_ = base / ("latmon_test_" + std::to_string(::getpid()) + "_" +
                        std::to_string(seq.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Polls `pred` until true or `timeout` elapses.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace test
} // namespace latmon
