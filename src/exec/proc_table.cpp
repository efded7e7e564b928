/*
 * Process table implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/proc_table.hpp>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace tasksup {

static bool is_pid_name(const char* s) {
    if (!s || !*s) return false;
    for (; *s; ++s) if (*s < '0' || *s > '9') return false;
    return true;
}

std::optional<ProcEntry> read_proc_entry(pid_t pid) {
    std::array<char, 64> path{};
    std::snprintf(path.data(), path.size(), "/proc/%d/stat", static_cast<int>(pid));
    FILE* f = std::fopen(path.data(), "r");
    if (!f) return std::nullopt;
    std::array<char, 1024> buf{};
    bool ok = std::fgets(buf.data(), buf.size(), f) != nullptr;
    std::fclose(f);
    if (!ok) return std::nullopt;

    // comm may contain spaces and parentheses; fields resume after the last ')'
    const char* comm_end = std::strrchr(buf.data(), ')');
    if (!comm_end || comm_end[1] == '\0') return std::nullopt;

    ProcEntry e; e.pid = pid;
    int ppid = 0, pgrp = 0;
    unsigned long utime = 0, stime = 0;
    unsigned long long starttime = 0;
    long rss_pages = 0;
    int n = std::sscanf(comm_end + 1,
        " %c %d %d %*d %*d %*d %*lu %*lu %*lu %*lu %*lu %lu %lu %*ld %*ld %*ld %*ld %*ld %*ld %llu %*lu %ld",
        &e.state, &ppid, &pgrp, &utime, &stime, &starttime, &rss_pages);
    if (n != 7) return std::nullopt;
    e.ppid = ppid; e.pgrp = pgrp;
    e.cpu_ticks = static_cast<unsigned long long>(utime) + stime;
    e.start_time = starttime;
    static const long page_size = ::sysconf(_SC_PAGESIZE);
    e.rss_bytes = static_cast<long long>(rss_pages) * page_size;
    return e;
}

std::vector<ProcEntry> list_group(pid_t pgid) {
    std::vector<ProcEntry> out;
    if (pgid <= 0) return out;
    DIR* proc_dir = opendir("/proc");
    if (!proc_dir) return out;
    struct dirent* entry = nullptr;
    while ((entry = readdir(proc_dir)) != nullptr) {
        if (!is_pid_name(entry->d_name)) continue;
        auto e = read_proc_entry(static_cast<pid_t>(std::atoi(entry->d_name)));
        if (!e) continue; // exited between readdir and open
        if (e->pgrp == pgid && e->live()) out.push_back(*e);
    }
    closedir(proc_dir);
    return out;
}

bool is_same_and_alive(const ProcEntry& e) {
    auto now = read_proc_entry(e.pid);
    return now && now->live() && now->start_time == e.start_time;
}

static std::string first_line(const char* path) {
    std::ifstream in(path);
    std::string line;
    if (!in || !std::getline(in, line)) return {};
    return line;
}

std::string memory_pressure_report() {
    std::string out;
    auto psi = first_line("/proc/pressure/memory"); // "some avg10=0.00 avg60=0.00 avg300=0.00 total=0"
    if (!psi.empty()) out += "psi: " + psi;

    std::ifstream meminfo("/proc/meminfo");
    std::string line, total, avail;
    while (meminfo && std::getline(meminfo, line)) {
        std::istringstream ls(line); std::string key, value, unit;
        ls >> key >> value >> unit;
        if (key == "MemTotal:") total = value;
        else if (key == "MemAvailable:") avail = value;
    }
    if (!total.empty() && !avail.empty()) {
        if (!out.empty()) out += ", ";
        out += "MemAvailable " + avail + " kB of " + total + " kB";
    }
    return out;
}

} // namespace tasksup
