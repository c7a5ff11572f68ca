#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace latmon {

struct ProcessInfo {
    int32_t     pid{0};
    std::string name;       // comm
    std::string cmdline;    // argv joined with spaces
    double      cpu_percent{0.0};
    uint64_t    memory_kb{0};
};

// Source of process-table snapshots. One instance per Sampler, so
// implementations may keep per-caller state (CPU deltas) without locking.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    // Fills `out` with the current table. false = enumeration failed this
    // time (transient); `out` contents are then unspecified.
    virtual bool snapshot(std::vector<ProcessInfo>& out) = 0;

    virtual const char* name() const = 0;
};

// ---------------------------------------------------------------------------
// Linux /proc scanner.
//
// CPU% is the share of one core consumed since the previous snapshot taken by
// this instance (utime+stime delta / wall delta). The first snapshot reports
// 0% for every process.
// Processes that vanish mid-scan are skipped, not treated as a failure.
// ---------------------------------------------------------------------------
class ProcFsProcessTable : public ProcessTable {
public:
    explicit ProcFsProcessTable(std::string proc_root = "/proc");

    bool snapshot(std::vector<ProcessInfo>& out) override;
    const char* name() const override { return "procfs"; }

private:
    bool read_process(int32_t pid, ProcessInfo& out, uint64_t& cpu_ticks) const;

    std::string proc_root_;
    long        ticks_per_sec_;
    long        page_kb_;

    std::unordered_map<int32_t, uint64_t> last_ticks_;
    std::chrono::steady_clock::time_point last_scan_{};
    bool have_last_{false};
};

} // namespace latmon
