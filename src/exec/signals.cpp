/*
 * Signal propagation implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/signals.hpp>
#include <task-supervisor/exec/proc_table.hpp>
#include <task-supervisor/util/errors.hpp>
#include <task-supervisor/util/log.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <unistd.h>

namespace tasksup {

std::string signal_name(int sig) {
    switch (sig) {
        case SIGHUP: return "SIGHUP";
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGABRT: return "SIGABRT";
        case SIGKILL: return "SIGKILL";
        case SIGSEGV: return "SIGSEGV";
        case SIGPIPE: return "SIGPIPE";
        case SIGTERM: return "SIGTERM";
        case SIGUSR1: return "SIGUSR1";
        case SIGUSR2: return "SIGUSR2";
    }
    return "signal " + std::to_string(sig);
}

static void send(pid_t target, int sig, bool group) {
    int rc = group ? ::killpg(target, sig) : ::kill(target, sig);
    if (rc != 0 && errno != ESRCH) {
        log::warn(errno_message(std::string(group ? "killpg(" : "kill(") + std::to_string(target) + ", " + signal_name(sig) + ")", errno));
    }
}

static std::vector<ProcEntry> still_alive(const std::vector<ProcEntry>& procs) {
    std::vector<ProcEntry> out;
    for (auto &p : procs) if (is_same_and_alive(p)) out.push_back(p);
    return out;
}

static bool wait_gone(const std::vector<ProcEntry>& procs, std::chrono::milliseconds budget) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (true) {
        if (still_alive(procs).empty()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

TerminationReport SignalPropagator::terminate(pid_t leader, pid_t known_pgid, bool reaped_leader, SignalLedger& ledger) const {
    TerminationReport report;
    // Read the group fresh: the leader may not have finished setsid() yet.
    pid_t pgid = known_pgid;
    if (!reaped_leader && leader > 0) {
        pid_t fresh = ::getpgid(leader);
        if (fresh > 0) pgid = fresh;
    }
    // Before election the child still sits in our group; never signal that.
    bool own_group = pgid <= 0 || pgid == ::getpgid(0);
    std::vector<ProcEntry> members;
    if (own_group) {
        if (!reaped_leader && leader > 0) {
            if (auto e = read_proc_entry(leader); e && e->live()) members.push_back(*e);
        }
    } else {
        members = list_group(pgid);
    }
    report.pgid = own_group ? 0 : pgid;
    for (auto &m : members) report.members.push_back(m.pid);
    if (members.empty()) {
        log::debug("terminate: no live processes in group ", pgid);
        return report;
    }

    log::info("Sending ", signal_name(m_policy.graceful_signal), " to group ", pgid, " (", members.size(), " processes)");
    ledger.record(m_policy.graceful_signal);
    if (own_group) send(leader, m_policy.graceful_signal, false);
    else send(pgid, m_policy.graceful_signal, true);

    wait_gone(members, m_policy.grace);
    auto remaining = still_alive(members);
    if (!own_group) {
        // members forked during the grace interval
        for (auto &e : list_group(pgid)) {
            bool known = std::any_of(remaining.begin(), remaining.end(), [&](const ProcEntry& r){ return r.pid == e.pid; });
            if (!known) remaining.push_back(e);
        }
    }
    if (remaining.empty()) return report;

    for (auto &p : remaining) report.force_killed.push_back(p.pid);
    log::warn("Processes did not exit within ", m_policy.grace.count(), "ms, sending ",
              signal_name(m_policy.forceful_signal), " to ", remaining.size(), " of them");
    ledger.record(m_policy.forceful_signal);
    for (auto &p : remaining) send(p.pid, m_policy.forceful_signal, false);
    if (!own_group) send(pgid, m_policy.forceful_signal, true);

    // A killed process needs a moment to become a zombie; this is not part of the grace policy.
    if (!wait_gone(remaining, std::chrono::milliseconds(1000))) {
        log::error("Processes in group ", pgid, " survived ", signal_name(m_policy.forceful_signal));
    }
    return report;
}

} // namespace tasksup
