/*
 * Logging implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/util/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace tasksup::log {

static std::atomic<int> g_level{static_cast<int>(Level::Info)};
static std::mutex g_write_mutex; // monitor thread and caller log concurrently

void set_level(Level lvl) { g_level = static_cast<int>(lvl); }

Level level() { return static_cast<Level>(g_level.load()); }

bool set_level(const std::string& name) {
    std::string lower = name; std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (lower=="debug") set_level(Level::Debug);
    else if (lower=="info") set_level(Level::Info);
    else if (lower=="warn" || lower=="warning") set_level(Level::Warn);
    else if (lower=="error") set_level(Level::Error);
    else return false;
    return true;
}

static const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void write(Level lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < g_level.load()) return;
    std::lock_guard<std::mutex> lk(g_write_mutex);
    std::cerr << "[task-supervisor] " << level_name(lvl) << ' ' << msg << '\n';
    std::cerr.flush();
}

} // namespace tasksup::log
