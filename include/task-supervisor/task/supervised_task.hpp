/*
 * Supervised task - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <task-supervisor/exec/config_stager.hpp>
#include <task-supervisor/exec/exit_watcher.hpp>
#include <task-supervisor/exec/launcher.hpp>
#include <task-supervisor/exec/monitor.hpp>
#include <task-supervisor/exec/signals.hpp>
#include <task-supervisor/listen/listener.hpp>
#include <task-supervisor/util/config.hpp>
#include <task-supervisor/util/metrics.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tasksup {

// What to run. The supervisor does not interpret the command.
struct WorkDescriptor {
    std::vector<std::string> command;
    std::map<std::string, std::string> environment;
    std::optional<std::string> run_as_user;
    // Identifies the unit of work; exported to the child as _TASKSUP_CONTEXT_<KEY>=<value>
    // and used (values joined by '.') as the metric suffix.
    std::vector<std::pair<std::string, std::string>> context;
    std::optional<std::string> working_dir;
    std::optional<std::string> log_file;
};

enum class TaskState { NotStarted, Starting, Running, Terminated };

const char* to_string(TaskState s);

// Runs one WorkDescriptor as its own process group and supervises it until it is reaped.
//
// start() emits Starting, stages the config, launches and waits for the group election, then
// starts resource monitoring and emits WorkRunning. Whoever reaps the child (return_code(),
// terminate() or the destructor) emits WorkSucceeded/WorkFailed followed by Stopping.
// terminate() and return_code() may be called from any thread.
class SupervisedTask {
public:
    SupervisedTask(WorkDescriptor work, Config config, ListenerRegistry& listeners, MetricsSink& metrics);
    SupervisedTask(WorkDescriptor work, Config config, SupervisorSettings settings,
                   ListenerRegistry& listeners, MetricsSink& metrics);
    ~SupervisedTask();

    SupervisedTask(const SupervisedTask&) = delete;
    SupervisedTask& operator=(const SupervisedTask&) = delete;

    // Throws LaunchError; the task then stays NotStarted (Starting/Stopping were still emitted).
    void start();

    // Escalating group termination, then reaps the child. No-op before start or after exit.
    void terminate();

    // nullopt if never started. Blocks until exit.
    std::optional<int> return_code();
    // Throws TerminationTimeout if still running after timeout; safe to call again.
    std::optional<int> return_code(std::chrono::milliseconds timeout);

    TaskState state() const { return m_state.load(); }
    std::optional<TerminationCause> termination_cause() const;
    bool has_process() const;
    pid_t pid() const { return m_pid.load(); }
    // Read fresh from the OS while the child is alive; the recorded group id afterwards.
    pid_t process_group_id() const;

    const WorkDescriptor& work() const { return m_work; }
    const SupervisorSettings& settings() const { return m_settings; }
    const std::string& config_path() const { return m_cfg_path; }
    std::string label() const;
    std::string metric_suffix() const;

    // True while the resource monitor thread is sampling.
    bool monitoring() const;

    // One-off measurement of the group; nullopt before start.
    std::optional<ResourceSample> sample_resources();

private:
    void launch_locked();
    void on_reaped(const ExitOutcome& outcome);
    ExitWatcher* current_watcher() const;
    std::vector<std::pair<std::string, std::string>> child_env() const;

    WorkDescriptor m_work;
    Config m_config;
    SupervisorSettings m_settings;
    ListenerBridge m_bridge;
    MetricsSink& m_metrics;
    ConfigStager m_stager;
    ProcessLauncher m_launcher;
    SignalPropagator m_propagator;
    SignalLedger m_ledger;

    mutable std::recursive_mutex m_lifecycle_mutex; // listeners may query the task while start() holds it
    std::atomic<TaskState> m_state{TaskState::NotStarted};
    std::atomic<pid_t> m_pid{0};
    std::atomic<pid_t> m_pgid{0};
    std::string m_cfg_path;
    std::unique_ptr<LifecycleScope> m_scope;
    std::unique_ptr<ExitWatcher> m_watcher;
    std::unique_ptr<ResourceMonitor> m_monitor;
};

} // namespace tasksup
