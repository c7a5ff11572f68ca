#include "query/ResourceProbe.hpp"
#include <fstream>
#include <sys/resource.h>
#include <unistd.h>

using namespace latmon;

static double process_cpu_seconds() {
    rusage ru{};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
    auto tv = [](const timeval& t) { return t.tv_sec + t.tv_usec / 1e6; };
    return tv(ru.ru_utime) + tv(ru.ru_stime);
}

ResourceProbe::ResourceProbe(std::string proc_self)
    : proc_self_(std::move(proc_self)),
      started_(std::chrono::steady_clock::now()),
      last_wall_(started_),
      last_cpu_sec_(process_cpu_seconds()) {}

uint64_t ResourceProbe::resident_mb() const {
    std::ifstream statm(proc_self_ + "/statm");
    uint64_t size_pages = 0, rss_pages = 0;
    if (!(statm >> size_pages >> rss_pages)) return 0;
    long page = sysconf(_SC_PAGESIZE);
    if (page <= 0) page = 4096;
    return rss_pages * static_cast<uint64_t>(page) / (1024 * 1024);
}

ResourceUsage ResourceProbe::sample() {
    const auto now = std::chrono::steady_clock::now();
    const double cpu = process_cpu_seconds();

    ResourceUsage r;
    r.uptime_seconds  = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now - started_).count());
    r.memory_usage_mb = resident_mb();

    std::lock_guard<std::mutex> lk(mtx_);
    double wall = std::chrono::duration<double>(now - last_wall_).count();
    if (wall > 0.0 && cpu >= last_cpu_sec_) {
        r.cpu_usage_percent = 100.0 * (cpu - last_cpu_sec_) / wall;
    }
    last_wall_    = now;
    last_cpu_sec_ = cpu;
    return r;
}
