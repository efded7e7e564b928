/*
 * Supervised task implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/task/supervised_task.hpp>
#include <task-supervisor/util/errors.hpp>
#include <task-supervisor/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <exception>
#include <sys/wait.h>
#include <unistd.h>

namespace tasksup {

const char* to_string(TaskState s) {
    switch (s) {
        case TaskState::NotStarted: return "not_started";
        case TaskState::Starting: return "starting";
        case TaskState::Running: return "running";
        case TaskState::Terminated: return "terminated";
    }
    return "?";
}

SupervisedTask::SupervisedTask(WorkDescriptor work, Config config, ListenerRegistry& listeners, MetricsSink& metrics)
    : SupervisedTask(std::move(work), config, SupervisorSettings::from_config(config), listeners, metrics) {}

SupervisedTask::SupervisedTask(WorkDescriptor work, Config config, SupervisorSettings settings,
                               ListenerRegistry& listeners, MetricsSink& metrics)
    : m_work(std::move(work)),
      m_config(std::move(config)),
      m_settings(std::move(settings)),
      m_bridge(listeners),
      m_metrics(metrics),
      m_stager(m_settings.staging_dir.empty() ? "/tmp" : m_settings.staging_dir, m_settings.privilege_helper),
      m_launcher(m_settings.privilege_helper),
      m_propagator(EscalationPolicy::from_settings(m_settings)) {}

SupervisedTask::~SupervisedTask() {
    try {
        if (auto* w = current_watcher(); w && !w->done()) {
            log::warn("Task ", label(), " destroyed while still running, terminating it");
            terminate();
        }
    } catch (const std::exception& e) {
        log::error("Task ", label(), ": cleanup failed: ", e.what());
    }
    if (m_monitor) m_monitor->stop();
    if (m_scope) m_scope->close();
    ConfigStager::unstage(m_cfg_path);
}

std::string SupervisedTask::metric_suffix() const {
    std::string out;
    for (auto &kv : m_work.context) {
        if (!out.empty()) out += '.';
        out += kv.second;
    }
    if (out.empty()) out = std::to_string(m_pid.load());
    return out;
}

std::string SupervisedTask::label() const {
    if (!m_work.context.empty()) return metric_suffix();
    return m_work.command.empty() ? std::string("<empty>") : m_work.command[0];
}

std::vector<std::pair<std::string, std::string>> SupervisedTask::child_env() const {
    std::vector<std::pair<std::string, std::string>> env(m_work.environment.begin(), m_work.environment.end());
    for (auto &kv : m_work.context) {
        std::string key = kv.first; std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        env.emplace_back("_TASKSUP_CONTEXT_" + key, kv.second);
    }
    env.emplace_back("TASKSUP_CONFIG", m_cfg_path);
    return env;
}

void SupervisedTask::start() {
    std::lock_guard<std::recursive_mutex> lk(m_lifecycle_mutex);
    if (m_scope) throw SupervisorError("task " + label() + " was already started");
    m_scope = std::make_unique<LifecycleScope>(m_bridge, *this);
    try {
        launch_locked();
    } catch (const LaunchError& e) {
        log::error("Failed to start task ", label(), ": ", e.what());
        ConfigStager::unstage(m_cfg_path);
        m_cfg_path.clear();
        m_scope->close();
        throw;
    }
}

void SupervisedTask::launch_locked() {
    // The copy is isolated exactly when the work runs under a separate identity.
    bool includes = m_work.run_as_user.has_value();
    m_cfg_path = m_stager.stage(m_config, includes, includes, m_work.run_as_user);

    LaunchSpec spec;
    spec.command = m_work.command;
    spec.env = child_env();
    spec.run_as_user = m_work.run_as_user;
    spec.working_dir = m_work.working_dir;
    spec.log_file = m_work.log_file;
    auto proc = m_launcher.launch(spec);
    m_pid = proc.pid;
    m_state = TaskState::Starting;

    try {
        m_pgid = wait_for_group_leader(proc.pid, m_settings.group_leader_timeout);
    } catch (const LaunchError&) {
        ::kill(proc.pid, SIGKILL);
        int st = 0; while (::waitpid(proc.pid, &st, 0) < 0 && errno == EINTR) {}
        m_pid = 0;
        m_state = TaskState::NotStarted;
        throw;
    }

    m_watcher = std::make_unique<ExitWatcher>(proc.pid, m_ledger, label(),
                                              [this](const ExitOutcome& o){ on_reaped(o); });
    m_monitor = std::make_unique<ResourceMonitor>(m_pgid.load(), metric_suffix(), m_metrics, m_settings.monitor_interval);
    m_state = TaskState::Running;
    log::info("Started task ", label(), " as pid ", proc.pid, " in process group ", m_pgid.load());
    // a WorkRunning listener may reap the child, and on_reaped() must find the monitor running
    m_monitor->start();
    m_bridge.notify(LifecycleEvent::WorkRunning, *this);
}

void SupervisedTask::on_reaped(const ExitOutcome& outcome) {
    m_state = TaskState::Terminated;
    if (m_monitor) m_monitor->stop();
    if (outcome.cause.kind == TerminationCause::Kind::SignaledExternally) {
        m_metrics.incr("task.killed_externally." + metric_suffix());
    }
    m_bridge.notify(outcome.return_code == 0 ? LifecycleEvent::WorkSucceeded : LifecycleEvent::WorkFailed, *this);
    if (m_scope) m_scope->close();
    ConfigStager::unstage(m_cfg_path);
}

ExitWatcher* SupervisedTask::current_watcher() const {
    std::lock_guard<std::recursive_mutex> lk(m_lifecycle_mutex);
    return m_watcher.get();
}

void SupervisedTask::terminate() {
    auto* w = current_watcher();
    if (!w) return;
    // it may already have finished on its own
    w->poll();
    auto report = m_propagator.terminate(m_pid.load(), m_pgid.load(), w->done(), m_ledger);
    if (!report.force_killed.empty()) {
        log::warn("Task ", label(), ": ", report.force_killed.size(), " process(es) needed ",
                  signal_name(m_propagator.policy().forceful_signal));
    }
    try {
        w->wait(std::chrono::seconds(5));
    } catch (const TerminationTimeout& e) {
        log::error("Task ", label(), " did not exit after termination: ", e.what());
    }
}

std::optional<int> SupervisedTask::return_code() {
    auto* w = current_watcher();
    if (!w) return std::nullopt;
    return w->wait().return_code;
}

std::optional<int> SupervisedTask::return_code(std::chrono::milliseconds timeout) {
    auto* w = current_watcher();
    if (!w) return std::nullopt;
    return w->wait(timeout).return_code;
}

std::optional<TerminationCause> SupervisedTask::termination_cause() const {
    auto* w = current_watcher();
    if (!w) return std::nullopt;
    auto r = w->result();
    if (!r) return std::nullopt;
    return r->cause;
}

bool SupervisedTask::has_process() const {
    auto s = m_state.load();
    return s == TaskState::Starting || s == TaskState::Running;
}

pid_t SupervisedTask::process_group_id() const {
    pid_t pid = m_pid.load();
    if (pid <= 0) return 0;
    auto* w = current_watcher();
    if (w && w->done()) return m_pgid.load();
    pid_t fresh = ::getpgid(pid);
    return fresh > 0 ? fresh : m_pgid.load();
}

bool SupervisedTask::monitoring() const {
    std::lock_guard<std::recursive_mutex> lk(m_lifecycle_mutex);
    return m_monitor && m_monitor->running();
}

std::optional<ResourceSample> SupervisedTask::sample_resources() {
    ResourceMonitor* m = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lk(m_lifecycle_mutex);
        m = m_monitor.get();
    }
    if (!m) return std::nullopt;
    return m->sample();
}

} // namespace tasksup
