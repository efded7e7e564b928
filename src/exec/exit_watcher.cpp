/*
 * Exit watcher implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/exit_watcher.hpp>
#include <task-supervisor/exec/proc_table.hpp>
#include <task-supervisor/util/errors.hpp>
#include <task-supervisor/util/log.hpp>
#include <algorithm>
#include <cerrno>
#include <sys/wait.h>
#include <thread>

namespace tasksup {

std::string describe(const TerminationCause& cause) {
    switch (cause.kind) {
        case TerminationCause::Kind::Exited: return "exited with " + std::to_string(cause.value);
        case TerminationCause::Kind::SignaledBySupervisor: return "terminated by supervisor with " + signal_name(cause.value);
        case TerminationCause::Kind::SignaledExternally: return "killed externally by " + signal_name(cause.value);
    }
    return "unknown";
}

ExitWatcher::ExitWatcher(pid_t pid, const SignalLedger& ledger, std::string label, ReapedCallback on_reaped)
    : m_pid(pid), m_ledger(ledger), m_label(std::move(label)), m_on_reaped(std::move(on_reaped)) {}

std::optional<ExitOutcome> ExitWatcher::result() const {
    if (!done()) return std::nullopt;
    return m_outcome;
}

static void report_external_kill(const std::string& label, pid_t pid, int sig) {
    std::string msg = "Task " + label + " (pid " + std::to_string(pid) + ") was killed by "
                    + signal_name(sig) + " before it finished";
    if (sig == SIGKILL) msg += " (likely due to running out of memory)";
    auto pressure = memory_pressure_report();
    if (!pressure.empty()) msg += "; memory at time of death: " + pressure;
    log::error(msg);
}

ExitOutcome ExitWatcher::classify(int status) const {
    ExitOutcome out;
    if (WIFEXITED(status)) {
        out.cause = {TerminationCause::Kind::Exited, WEXITSTATUS(status)};
        out.return_code = WEXITSTATUS(status);
        return out;
    }
    int sig = WIFSIGNALED(status) ? WTERMSIG(status) : SIGKILL;
    out.return_code = -sig;
    if (m_ledger.sent(sig)) {
        out.cause = {TerminationCause::Kind::SignaledBySupervisor, sig};
    } else {
        out.cause = {TerminationCause::Kind::SignaledExternally, sig};
        report_external_kill(m_label, m_pid, sig);
    }
    return out;
}

void ExitWatcher::finish_locked(const ExitOutcome& outcome) {
    m_outcome = outcome;
    m_done.store(true, std::memory_order_release);
    log::info("Task ", m_label, " (pid ", m_pid, ") ", describe(outcome.cause), ", return code ", outcome.return_code);
    if (m_on_reaped) m_on_reaped(m_outcome);
}

void ExitWatcher::try_reap_locked() {
    if (done()) return;
    int status = 0;
    pid_t r;
    do { r = ::waitpid(m_pid, &status, WNOHANG); } while (r < 0 && errno == EINTR);
    if (r == 0) return;
    if (r == m_pid) { finish_locked(classify(status)); return; }
    if (errno == ECHILD) {
        // Something else reaped our child; the real status is lost.
        log::error("Task ", m_label, " (pid ", m_pid, ") was reaped elsewhere, assuming it was killed (likely due to running out of memory)");
        finish_locked(ExitOutcome{{TerminationCause::Kind::SignaledExternally, SIGKILL}, -SIGKILL});
        return;
    }
    throw SupervisorError(errno_message("waitpid(" + std::to_string(m_pid) + ")", errno));
}

std::optional<ExitOutcome> ExitWatcher::poll() {
    if (done()) return m_outcome;
    std::lock_guard<std::mutex> lk(m_reap_mutex);
    try_reap_locked();
    return result();
}

ExitOutcome ExitWatcher::wait() {
    while (!done()) {
        // Block without reaping so concurrent waiters never race on waitpid().
        siginfo_t si{};
        int rc = ::waitid(P_PID, static_cast<id_t>(m_pid), &si, WEXITED | WNOWAIT);
        if (rc != 0 && errno == EINTR) continue;
        if (rc != 0 && errno != ECHILD) throw SupervisorError(errno_message("waitid(" + std::to_string(m_pid) + ")", errno));
        std::lock_guard<std::mutex> lk(m_reap_mutex);
        try_reap_locked();
    }
    return m_outcome;
}

ExitOutcome ExitWatcher::wait(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto r = poll()) return *r;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw TerminationTimeout("task " + m_label + " (pid " + std::to_string(m_pid)
                                     + ") still running after " + std::to_string(timeout.count()) + "ms");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(10)));
    }
}

} // namespace tasksup
