/*
 * Signal propagation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <task-supervisor/util/config.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

namespace tasksup {

// Signals this supervisor has delivered to a task's group. Written by the propagator,
// read by the exit watcher to tell our kills from out-of-band ones.
class SignalLedger {
public:
    void record(int sig) { if (sig > 0 && sig < 64) m_mask.fetch_or(uint64_t{1} << sig); }
    bool sent(int sig) const { return sig > 0 && sig < 64 && (m_mask.load() & (uint64_t{1} << sig)); }
    bool any() const { return m_mask.load() != 0; }
private:
    std::atomic<uint64_t> m_mask{0};
};

struct EscalationPolicy {
    int graceful_signal = SIGTERM;
    int forceful_signal = SIGKILL;
    std::chrono::milliseconds grace{5000};

    static EscalationPolicy from_settings(const SupervisorSettings& s) {
        return EscalationPolicy{s.graceful_signal, s.forceful_signal, s.kill_grace_period};
    }
};

struct TerminationReport {
    pid_t pgid = 0;
    std::vector<pid_t> members;       // live when terminate() started
    std::vector<pid_t> force_killed;  // still alive after the grace interval
    bool noop() const { return members.empty(); }
};

class SignalPropagator {
public:
    explicit SignalPropagator(EscalationPolicy policy) : m_policy(policy) {}

    // Graceful signal to the whole group, bounded wait, forceful signal to what is left.
    // leader: the task's direct child; known_pgid: group id recorded at election, used when
    // the leader is gone or reaped_leader is true (its pid may have been reused).
    // Idempotent: a group without live members is a no-op. ESRCH is success.
    TerminationReport terminate(pid_t leader, pid_t known_pgid, bool reaped_leader, SignalLedger& ledger) const;

    const EscalationPolicy& policy() const { return m_policy; }

private:
    EscalationPolicy m_policy;
};

std::string signal_name(int sig);

} // namespace tasksup
