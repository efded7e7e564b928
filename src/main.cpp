// task-supervisor: run one command as a supervised process group
#include <task-supervisor/task/supervised_task.hpp>
#include <task-supervisor/listen/listener.hpp>
#include <task-supervisor/util/config.hpp>
#include <task-supervisor/util/errors.hpp>
#include <task-supervisor/util/log.hpp>
#include <task-supervisor/util/metrics.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace tasksup;

static volatile sig_atomic_t g_stop_signal = 0;
static void stop_handler(int sig){ g_stop_signal = sig; }

static void usage() {
    std::cerr << "Usage: task-supervisor [--config FILE] [--run-as USER] [--env K=V]... [--context K=V]...\n"
                 "                       [--timeout SECONDS] [--cwd DIR] [--log-file FILE] [-v] -- command [args...]\n";
}

static bool split_kv(const std::string& a, std::string& k, std::string& v) {
    auto eq = a.find('=');
    if (eq==std::string::npos || eq==0) return false;
    k = a.substr(0,eq); v = a.substr(eq+1);
    return true;
}

// Prints lifecycle transitions so a terminal user sees what the supervisor is doing.
class LoggingListener : public TaskListener {
public:
    void on_starting(const SupervisedTask& t) override { log::info("[", t.label(), "] starting"); }
    void on_work_running(const SupervisedTask& t) override { log::info("[", t.label(), "] running, pid ", t.pid()); }
    void on_work_succeeded(const SupervisedTask& t) override { log::info("[", t.label(), "] succeeded"); }
    void on_work_failed(const SupervisedTask& t) override {
        auto cause = t.termination_cause();
        log::info("[", t.label(), "] failed: ", cause ? describe(*cause) : std::string("unknown"));
    }
    void before_stopping(const SupervisedTask& t) override { log::debug("[", t.label(), "] stopping"); }
};

int main(int argc, char* argv[]) {
    WorkDescriptor work;
    std::optional<std::string> config_file;
    std::optional<double> timeout_s;
    bool verbose = false;

    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* opt) -> std::string {
            if (i+1 >= argc) { std::cerr << opt << ": missing value\n"; usage(); std::exit(2); }
            return argv[++i];
        };
        std::string k, v;
        if (a=="--") { ++i; break; }
        else if (a=="--config") config_file = need("--config");
        else if (a=="--run-as") work.run_as_user = need("--run-as");
        else if (a=="--cwd") work.working_dir = need("--cwd");
        else if (a=="--log-file") work.log_file = need("--log-file");
        else if (a=="--env") { if (!split_kv(need("--env"), k, v)) { std::cerr << "--env: expected K=V\n"; return 2; } work.environment[k] = v; }
        else if (a=="--context") { if (!split_kv(need("--context"), k, v)) { std::cerr << "--context: expected K=V\n"; return 2; } work.context.emplace_back(k, v); }
        else if (a=="--timeout") {
            auto val = need("--timeout");
            try { timeout_s = std::stod(val); } catch (const std::exception&) { std::cerr << "--timeout: not a number: " << val << '\n'; return 2; }
        }
        else if (a=="-v"||a=="--verbose") verbose = true;
        else if (a=="-h"||a=="--help") { usage(); return 0; }
        else if (!a.empty() && a[0]=='-') { std::cerr << "unknown option " << a << '\n'; usage(); return 2; }
        else break;
    }
    for (; i < argc; ++i) work.command.emplace_back(argv[i]);
    if (work.command.empty()) { usage(); return 2; }

    Config cfg;
    if (config_file) {
        auto loaded = Config::load_file(*config_file);
        if (!loaded) { std::perror(("open " + *config_file).c_str()); return 2; }
        cfg = *loaded;
    } else {
        cfg = Config::load_default();
    }
    auto settings = SupervisorSettings::from_config(cfg);
    if (!log::set_level(settings.log_level)) log::warn("unknown log_level '", settings.log_level, "'");
    if (verbose) log::set_level(log::Level::Debug);

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);

    ListenerRegistry listeners;
    listeners.add_listener(std::make_shared<LoggingListener>());
    LogMetricsSink metrics;
    SupervisedTask task(work, cfg, settings, listeners, metrics);
    try {
        task.start();
    } catch (const LaunchError& e) {
        std::cerr << "task-supervisor: " << e.what() << '\n';
        return 127;
    }

    auto started = std::chrono::steady_clock::now();
    std::optional<int> rc;
    while (!rc) {
        try {
            rc = task.return_code(std::chrono::milliseconds(200));
        } catch (const TerminationTimeout&) {
            bool expired = timeout_s && std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count() >= *timeout_s;
            if (g_stop_signal || expired) {
                if (expired) log::warn("timeout of ", *timeout_s, "s reached, terminating");
                else log::info("received signal ", g_stop_signal, ", terminating");
                task.terminate();
                rc = task.return_code();
            }
        }
    }
    int code = *rc;
    if (code < 0) return 128 + (-code);
    return code;
}
