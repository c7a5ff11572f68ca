#include "sampler/ProcessTable.hpp"
#include <cctype>
#include <cstdlib>
#include <dirent.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace latmon;

ProcFsProcessTable::ProcFsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)),
      ticks_per_sec_(sysconf(_SC_CLK_TCK)),
      page_kb_(sysconf(_SC_PAGESIZE) / 1024) {
    if (ticks_per_sec_ <= 0) ticks_per_sec_ = 100;
    if (page_kb_ <= 0) page_kb_ = 4;
}

static bool all_digits(const char* s) {
    if (!*s) return false;
    for (; *s; ++s) {
        if (!std::isdigit(static_cast<unsigned char>(*s))) return false;
    }
    return true;
}

// /proc/<pid>/stat: "pid (comm) state ppid ... utime(14) stime(15) ...".
// comm may contain spaces and parentheses, so split on the LAST ')'.
bool ProcFsProcessTable::read_process(int32_t pid, ProcessInfo& out,
                                      uint64_t& cpu_ticks) const {
    const std::string base = proc_root_ + "/" + std::to_string(pid);

    std::ifstream stat(base + "/stat");
    if (!stat.is_open()) return false;
    std::string line;
    if (!std::getline(stat, line)) return false;

    auto open  = line.find('(');
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open ||
        close + 2 > line.size()) {
        return false;
    }

    out.pid  = pid;
    out.name = line.substr(open + 1, close - open - 1);

    std::istringstream rest(line.substr(close + 2));
    std::string field;
    uint64_t utime = 0, stime = 0;
    // Fields after comm start at index 3 (state). utime=14, stime=15.
    for (int idx = 3; idx <= 15 && rest >> field; ++idx) {
        if (idx == 14) utime = std::strtoull(field.c_str(), nullptr, 10);
        if (idx == 15) stime = std::strtoull(field.c_str(), nullptr, 10);
    }
    cpu_ticks = utime + stime;

    std::ifstream statm(base + "/statm");
    uint64_t size_pages = 0, rss_pages = 0;
    if (statm >> size_pages >> rss_pages) {
        out.memory_kb = rss_pages * static_cast<uint64_t>(page_kb_);
    }

    std::ifstream cmd(base + "/cmdline", std::ios::binary);
    std::string raw((std::istreambuf_iterator<char>(cmd)), std::istreambuf_iterator<char>());
    for (char& c : raw) {
        if (c == '\0') c = ' ';
    }
    while (!raw.empty() && raw.back() == ' ') raw.pop_back();
    out.cmdline = std::move(raw);

    return true;
}

bool ProcFsProcessTable::snapshot(std::vector<ProcessInfo>& out) {
    out.clear();

    DIR* dir = opendir(proc_root_.c_str());
    if (!dir) return false;

    auto now = std::chrono::steady_clock::now();
    double wall_sec = have_last_
        ? std::chrono::duration<double>(now - last_scan_).count()
        : 0.0;

    std::unordered_map<int32_t, uint64_t> ticks;

    while (dirent* ent = readdir(dir)) {
        if (!all_digits(ent->d_name)) continue;

        int32_t pid = static_cast<int32_t>(std::atoi(ent->d_name));
        ProcessInfo info;
        uint64_t cpu_ticks = 0;
        if (!read_process(pid, info, cpu_ticks)) continue;   // exited mid-scan

        auto prev = last_ticks_.find(pid);
        if (wall_sec > 0.0 && prev != last_ticks_.end() && cpu_ticks >= prev->second) {
            double cpu_sec = static_cast<double>(cpu_ticks - prev->second) / ticks_per_sec_;
            info.cpu_percent = 100.0 * cpu_sec / wall_sec;
        }

        ticks[pid] = cpu_ticks;
        out.push_back(std::move(info));
    }
    closedir(dir);

    last_ticks_ = std::move(ticks);
    last_scan_  = now;
    have_last_  = true;
    return true;
}
