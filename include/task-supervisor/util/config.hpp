/*
 * Configuration source - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <csignal>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tasksup {

// Ordered key=value store read from an rc-style file ('#' comments, first '=' splits).
class Config {
public:
    Config() = default;

    static std::optional<Config> load_file(const std::string& path);
    // $TASKSUP_CONFIG_FILE, else $HOME/.task-supervisorrc; empty config if neither is readable.
    static Config load_default();
    static Config parse(const std::string& text);

    void set(const std::string& key, const std::string& value);
    bool has(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& def) const;
    long long get_int(const std::string& key, long long def) const;
    bool get_bool(const std::string& key, bool def) const;

    // Snapshot handed to the config stager.
    // include_env: TASKSUP__<KEY> variables from the environment override entries (key lower-cased).
    // include_cmds: "<key>_cmd" entries are run through /bin/sh and their trimmed stdout stored
    // under <key>; otherwise they are kept verbatim.
    std::map<std::string, std::string> as_map(bool include_env, bool include_cmds) const;

    const std::vector<std::pair<std::string, std::string>>& entries() const { return m_entries; }

private:
    std::vector<std::pair<std::string, std::string>> m_entries;
};

// Serializes a snapshot in the same format Config::parse reads.
std::string to_rc_text(const std::map<std::string, std::string>& values);

// Process-wide supervisor knobs. The escalation policy is one global default, not per task.
struct SupervisorSettings {
    std::chrono::milliseconds kill_grace_period{5000};
    std::chrono::milliseconds monitor_interval{5000};
    std::chrono::milliseconds group_leader_timeout{1000};
    std::string privilege_helper = "sudo";
    std::string staging_dir;              // empty -> $TMPDIR or /tmp
    int graceful_signal = SIGTERM;
    int forceful_signal = SIGKILL;
    std::string log_level = "info";

    static SupervisorSettings from_config(const Config& cfg);
};

// "SIGTERM", "TERM" or "15" -> 15; nullopt if unknown.
std::optional<int> parse_signal(const std::string& s);

} // namespace tasksup
