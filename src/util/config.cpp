/*
 * Configuration source implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/util/config.hpp>
#include <task-supervisor/util/log.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/wait.h>

extern char** environ;

namespace tasksup {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }

Config Config::parse(const std::string& text) {
    Config cfg;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back()=='\r') line.pop_back();
        auto t = trim(line);
        if (t.empty() || t[0]=='#') continue;
        auto eq = line.find('=');
        if (eq==std::string::npos) continue;
        auto key = trim(line.substr(0, eq));
        if (key.empty()) continue;
        cfg.set(key, line.substr(eq+1));
    }
    return cfg;
}

std::optional<Config> Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream oss; oss << in.rdbuf();
    return parse(oss.str());
}

Config Config::load_default() {
    std::string path = getenv_or("TASKSUP_CONFIG_FILE");
    if (path.empty()) {
        std::string home = getenv_or("HOME");
        if (home.empty()) return Config{};
        path = home + "/.task-supervisorrc";
    }
    auto cfg = load_file(path);
    if (!cfg) { log::debug("no configuration file at ", path); return Config{}; }
    return *cfg;
}

void Config::set(const std::string& key, const std::string& value) {
    for (auto &e : m_entries) if (e.first==key) { e.second = value; return; }
    m_entries.emplace_back(key, value);
}

bool Config::has(const std::string& key) const { return get(key).has_value(); }

std::optional<std::string> Config::get(const std::string& key) const {
    for (auto &e : m_entries) if (e.first==key) return e.second;
    return std::nullopt;
}

std::string Config::get_or(const std::string& key, const std::string& def) const {
    auto v = get(key); return v ? *v : def;
}

long long Config::get_int(const std::string& key, long long def) const {
    auto v = get(key);
    if (!v) return def;
    try {
        size_t used = 0;
        long long r = std::stoll(trim(*v), &used);
        if (used != trim(*v).size()) throw std::invalid_argument(*v);
        return r;
    } catch (const std::exception&) {
        log::warn("config: '", key, "' is not a number (", *v, "), using ", def);
        return def;
    }
}

bool Config::get_bool(const std::string& key, bool def) const {
    auto v = get(key);
    if (!v) return def;
    std::string lower = trim(*v); std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (lower=="1"||lower=="true"||lower=="on"||lower=="yes") return true;
    if (lower=="0"||lower=="false"||lower=="off"||lower=="no") return false;
    return def;
}

static std::optional<std::string> run_cmd_option(const std::string& key, const std::string& cmd) {
    FILE* p = ::popen(cmd.c_str(), "r");
    if (!p) { log::warn("config: cannot run command for '", key, "'"); return std::nullopt; }
    std::string out; std::array<char, 256> buf{};
    size_t n;
    while ((n = std::fread(buf.data(), 1, buf.size(), p)) > 0) out.append(buf.data(), n);
    int st = ::pclose(p);
    if (st == -1 || !WIFEXITED(st) || WEXITSTATUS(st) != 0) {
        log::warn("config: command for '", key, "' failed");
        return std::nullopt;
    }
    return trim(out);
}

std::map<std::string, std::string> Config::as_map(bool include_env, bool include_cmds) const {
    std::map<std::string, std::string> out;
    for (auto &e : m_entries) out[e.first] = e.second;
    if (include_env && environ) {
        const std::string prefix = "TASKSUP__";
        for (char** env = environ; *env; ++env) {
            std::string kv = *env;
            if (kv.rfind(prefix, 0) != 0) continue;
            auto eq = kv.find('=');
            if (eq==std::string::npos || eq==prefix.size()) continue;
            std::string key = kv.substr(prefix.size(), eq-prefix.size());
            std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            out[key] = kv.substr(eq+1);
        }
    }
    if (include_cmds) {
        const std::string suffix = "_cmd";
        std::vector<std::string> cmd_keys;
        for (auto &kv : out) {
            auto &k = kv.first;
            if (k.size() > suffix.size() && k.compare(k.size()-suffix.size(), suffix.size(), suffix)==0) cmd_keys.push_back(k);
        }
        for (auto &k : cmd_keys) {
            std::string base = k.substr(0, k.size()-suffix.size());
            auto cmd = out[k];
            out.erase(k);
            if (out.count(base)) continue; // an explicit value wins over its _cmd
            if (auto v = run_cmd_option(base, cmd)) out[base] = *v;
        }
    }
    return out;
}

std::string to_rc_text(const std::map<std::string, std::string>& values) {
    std::string out = "# staged by task-supervisor\n";
    for (auto &kv : values) {
        // values are written verbatim; a newline would split the entry
        std::string v = kv.second; std::replace(v.begin(), v.end(), '\n', ' ');
        out += kv.first + "=" + v + "\n";
    }
    return out;
}

std::optional<int> parse_signal(const std::string& s) {
    std::string name = trim(s);
    if (name.empty()) return std::nullopt;
    if (std::all_of(name.begin(), name.end(), [](unsigned char c){ return std::isdigit(c); })) {
        int sig = std::atoi(name.c_str());
        if (sig > 0 && sig < NSIG) return sig;
        return std::nullopt;
    }
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (name.rfind("SIG", 0)==0) name = name.substr(3);
    static const std::pair<const char*, int> table[] = {
        {"HUP", SIGHUP}, {"INT", SIGINT}, {"QUIT", SIGQUIT}, {"KILL", SIGKILL},
        {"USR1", SIGUSR1}, {"USR2", SIGUSR2}, {"TERM", SIGTERM},
    };
    for (auto &p : table) if (name==p.first) return p.second;
    return std::nullopt;
}

SupervisorSettings SupervisorSettings::from_config(const Config& cfg) {
    SupervisorSettings s;
    s.kill_grace_period = std::chrono::milliseconds(cfg.get_int("kill_grace_period_ms", s.kill_grace_period.count()));
    s.monitor_interval = std::chrono::milliseconds(cfg.get_int("monitor_interval_ms", s.monitor_interval.count()));
    s.group_leader_timeout = std::chrono::milliseconds(cfg.get_int("group_leader_timeout_ms", s.group_leader_timeout.count()));
    s.privilege_helper = cfg.get_or("privilege_helper", s.privilege_helper);
    s.staging_dir = cfg.get_or("staging_dir", getenv_or("TMPDIR", "/tmp"));
    if (s.staging_dir.empty()) s.staging_dir = "/tmp";
    s.log_level = cfg.get_or("log_level", s.log_level);
    if (auto v = cfg.get("graceful_signal")) {
        if (auto sig = parse_signal(*v)) s.graceful_signal = *sig;
        else log::warn("config: unknown graceful_signal '", *v, "'");
    }
    if (auto v = cfg.get("forceful_signal")) {
        if (auto sig = parse_signal(*v)) s.forceful_signal = *sig;
        else log::warn("config: unknown forceful_signal '", *v, "'");
    }
    if (s.kill_grace_period.count() < 0) s.kill_grace_period = std::chrono::milliseconds(0);
    if (s.monitor_interval.count() <= 0) s.monitor_interval = std::chrono::milliseconds(5000);
    return s;
}

} // namespace tasksup
