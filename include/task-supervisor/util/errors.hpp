/*
 * Error types - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace tasksup {

class SupervisorError : public std::runtime_error {
public:
    explicit SupervisorError(const std::string& what) : std::runtime_error(what) {}
};

// start() could not bring the task to Running (staging, chown, fork, exec, group election).
class LaunchError : public SupervisorError {
public:
    explicit LaunchError(const std::string& what) : SupervisorError(what) {}
};

// A bounded wait for exit elapsed; the task is untouched and may be waited on again.
class TerminationTimeout : public SupervisorError {
public:
    explicit TerminationTimeout(const std::string& what) : SupervisorError(what) {}
};

// "<what>: <strerror(err)>"
std::string errno_message(const std::string& what, int err);

} // namespace tasksup
