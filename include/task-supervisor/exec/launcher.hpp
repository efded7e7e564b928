/*
 * Process launcher - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace tasksup {

struct LaunchSpec {
    std::vector<std::string> command;
    // Applied in order over the supervisor's own environment; later entries win.
    std::vector<std::pair<std::string, std::string>> env;
    std::optional<std::string> run_as_user;
    std::optional<std::string> working_dir;
    std::optional<std::string> log_file;   // child stdout+stderr, appended
};

struct LaunchedProcess {
    pid_t pid = 0;
    std::vector<std::string> argv; // what was actually exec'd (helper prefix included)
};

class ProcessLauncher {
public:
    explicit ProcessLauncher(std::string privilege_helper = "sudo") : m_helper(std::move(privilege_helper)) {}

    // Forks a child that becomes a session (and process group) leader, then execs the command.
    // Throws LaunchError synchronously on empty command, missing binary, fork/exec failure.
    LaunchedProcess launch(const LaunchSpec& spec) const;

    // The argv that launch() would exec: the command, or the privilege helper
    // "-E -H -u <user> --" prefix when run_as_user is not the current user.
    std::vector<std::string> build_argv(const LaunchSpec& spec) const;

private:
    std::string m_helper;
};

// Effective user name of this process.
std::string current_user();

// True when user is set and differs from current_user().
bool needs_identity_switch(const std::optional<std::string>& user);

// Bounded poll until getpgid(pid) == pid. Returns the group id; throws LaunchError on timeout
// or if the pid disappears.
pid_t wait_for_group_leader(pid_t pid, std::chrono::milliseconds timeout);

} // namespace tasksup
