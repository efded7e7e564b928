/*
 * Exit watcher - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <task-supervisor/exec/signals.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace tasksup {

struct TerminationCause {
    enum class Kind { Exited, SignaledBySupervisor, SignaledExternally };
    Kind kind = Kind::Exited;
    int value = 0; // exit code or signal number

    bool operator==(const TerminationCause& o) const { return kind == o.kind && value == o.value; }
    bool operator!=(const TerminationCause& o) const { return !(*this == o); }
};

std::string describe(const TerminationCause& cause);

struct ExitOutcome {
    TerminationCause cause;
    int return_code = 0; // exit code, or -signal
};

// Reaps the task's direct child and classifies how it ended. The result is computed once
// and cached; every later wait returns it.
class ExitWatcher {
public:
    // on_reaped runs exactly once, on the thread that reaped, before any waiter returns the
    // outcome from the slow path.
    using ReapedCallback = std::function<void(const ExitOutcome&)>;

    ExitWatcher(pid_t pid, const SignalLedger& ledger, std::string label, ReapedCallback on_reaped = {});

    ExitWatcher(const ExitWatcher&) = delete;
    ExitWatcher& operator=(const ExitWatcher&) = delete;

    // Blocks until the child has exited.
    ExitOutcome wait();
    // Throws TerminationTimeout if the child is still running after timeout; may be retried.
    ExitOutcome wait(std::chrono::milliseconds timeout);
    // Non-blocking attempt.
    std::optional<ExitOutcome> poll();

    bool done() const { return m_done.load(std::memory_order_acquire); }
    std::optional<ExitOutcome> result() const;
    pid_t pid() const { return m_pid; }

private:
    void try_reap_locked();
    void finish_locked(const ExitOutcome& outcome);
    ExitOutcome classify(int status) const;

    pid_t m_pid;
    const SignalLedger& m_ledger;
    std::string m_label;
    ReapedCallback m_on_reaped;

    std::mutex m_reap_mutex;
    std::atomic<bool> m_done{false};
    ExitOutcome m_outcome;
};

} // namespace tasksup
