/*
 * Logging - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <sstream>
#include <utility>

namespace tasksup::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_level(Level lvl);
Level level();
// Accepts debug|info|warn|warning|error (case-insensitive). Returns false if unknown.
bool set_level(const std::string& name);

// Writes "[task-supervisor] LEVEL msg" to std::cerr if lvl passes the threshold.
void write(Level lvl, const std::string& msg);

template <class... Args>
std::string concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template <class... Args> void debug(Args&&... a) { if (level() <= Level::Debug) write(Level::Debug, concat(std::forward<Args>(a)...)); }
template <class... Args> void info(Args&&... a)  { if (level() <= Level::Info)  write(Level::Info,  concat(std::forward<Args>(a)...)); }
template <class... Args> void warn(Args&&... a)  { if (level() <= Level::Warn)  write(Level::Warn,  concat(std::forward<Args>(a)...)); }
template <class... Args> void error(Args&&... a) { write(Level::Error, concat(std::forward<Args>(a)...)); }

} // namespace tasksup::log
