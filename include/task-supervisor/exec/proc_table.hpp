/*
 * Process table (/proc) queries - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace tasksup {

// One row of /proc/<pid>/stat. Queries against a pid that no longer exists yield nullopt.
struct ProcEntry {
    pid_t pid = 0;
    pid_t ppid = 0;
    pid_t pgrp = 0;
    char state = '?';                    // R S D Z T ...; Z and X are not live
    unsigned long long cpu_ticks = 0;    // utime + stime, in clock ticks
    unsigned long long start_time = 0;   // ticks after boot; distinguishes reused pids
    long long rss_bytes = 0;

    bool live() const { return state != 'Z' && state != 'X'; }
};

std::optional<ProcEntry> read_proc_entry(pid_t pid);

// Every live (non-zombie) process whose process group is pgid. Empty if the group is gone.
std::vector<ProcEntry> list_group(pid_t pgid);

// Same process as `e` (pid not reused) and still live.
bool is_same_and_alive(const ProcEntry& e);

// Best-effort description of system memory pressure: PSI (/proc/pressure/memory)
// and MemAvailable/MemTotal from /proc/meminfo. Empty if nothing could be read.
std::string memory_pressure_report();

} // namespace tasksup
