#include "query/HostStats.hpp"
#include <cctype>
#include <dirent.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace latmon;

HostStats::HostStats(std::string proc_root) : proc_root_(std::move(proc_root)) {}

// "MemTotal:       16314564 kB"
void HostStats::read_meminfo(HostResources& out) const {
    std::ifstream in(proc_root_ + "/meminfo");
    std::string line;
    uint64_t total_kb = 0, available_kb = 0, free_kb = 0;
    bool have_available = false;

    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::string key;
        uint64_t kb = 0;
        if (!(ss >> key >> kb)) continue;
        if (key == "MemTotal:") {
            total_kb = kb;
        } else if (key == "MemAvailable:") {
            available_kb = kb;
            have_available = true;
        } else if (key == "MemFree:") {
            free_kb = kb;
        }
    }
    // Kernels before 3.14 have no MemAvailable.
    if (!have_available) available_kb = free_kb;
    if (available_kb > total_kb) available_kb = total_kb;

    out.memory_total     = total_kb * 1024;
    out.memory_available = available_kb * 1024;
    out.memory_used      = out.memory_total - out.memory_available;
}

// "0.52 0.58 0.59 1/389 12345"
void HostStats::read_loadavg(HostResources& out) const {
    std::ifstream in(proc_root_ + "/loadavg");
    double one = 0.0, five = 0.0, fifteen = 0.0;
    if (in >> one >> five >> fifteen) {
        out.load_one     = one;
        out.load_five    = five;
        out.load_fifteen = fifteen;
    }
}

// "350735.47 234388.90"
void HostStats::read_uptime(HostResources& out) const {
    std::ifstream in(proc_root_ + "/uptime");
    double up = 0.0;
    if (in >> up && up > 0.0) out.uptime_seconds = static_cast<uint64_t>(up);
}

uint64_t HostStats::count_processes() const {
    DIR* dir = opendir(proc_root_.c_str());
    if (!dir) return 0;

    uint64_t n = 0;
    while (dirent* ent = readdir(dir)) {
        const char* s = ent->d_name;
        if (!*s) continue;
        bool digits = true;
        for (; *s; ++s) {
            if (!std::isdigit(static_cast<unsigned char>(*s))) { digits = false; break; }
        }
        if (digits) ++n;
    }
    closedir(dir);
    return n;
}

HostResources HostStats::sample() const {
    HostResources r;
    r.sampled_at = wall_now();
    read_meminfo(r);
    read_loadavg(r);
    read_uptime(r);
    r.processes = count_processes();

    long cpus = sysconf(_SC_NPROCESSORS_ONLN);
    r.cpu_count = cpus > 0 ? static_cast<uint32_t>(cpus) : 1;
    return r;
}
