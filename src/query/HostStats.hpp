#pragma once
#include <string>

#include "model/Snapshot.hpp"

namespace latmon {

// Machine-wide memory, load, process count and uptime from procfs.
// A file that cannot be read leaves its fields at zero.
class HostStats {
public:
    explicit HostStats(std::string proc_root = "/proc");

    HostResources sample() const;

private:
    void read_meminfo(HostResources& out) const;
    void read_loadavg(HostResources& out) const;
    void read_uptime(HostResources& out) const;
    uint64_t count_processes() const;

    std::string proc_root_;
};

} // namespace latmon
