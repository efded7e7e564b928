/*
 * Process launcher implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/launcher.hpp>
#include <task-supervisor/exec/path.hpp>
#include <task-supervisor/util/errors.hpp>
#include <task-supervisor/util/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <map>
#include <pwd.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace tasksup {

std::string current_user() {
    if (struct passwd* pw = ::getpwuid(::geteuid())) return pw->pw_name;
    const char* u = std::getenv("USER");
    return u ? u : "";
}

bool needs_identity_switch(const std::optional<std::string>& user) {
    return user && !user->empty() && *user != current_user();
}

std::vector<std::string> ProcessLauncher::build_argv(const LaunchSpec& spec) const {
    std::vector<std::string> argv;
    if (needs_identity_switch(spec.run_as_user)) {
        argv = {m_helper, "-E", "-H", "-u", *spec.run_as_user, "--"};
    }
    argv.insert(argv.end(), spec.command.begin(), spec.command.end());
    return argv;
}

// Owns a raw fd until moved out; keeps the error paths below from leaking.
struct FdGuard {
    int fd = -1;
    explicit FdGuard(int f = -1) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int release() { int f = fd; fd = -1; return f; }
};

LaunchedProcess ProcessLauncher::launch(const LaunchSpec& spec) const {
    if (spec.command.empty()) throw LaunchError("empty command");
    LaunchedProcess out;
    out.argv = build_argv(spec);

    // Final environment: ours, overlaid with the launch entries.
    std::map<std::string, std::string> env;
    if (environ) {
        for (char** e = environ; *e; ++e) {
            std::string kv = *e; auto eq = kv.find('=');
            if (eq == std::string::npos) continue;
            env[kv.substr(0, eq)] = kv.substr(eq+1);
        }
    }
    for (auto &kv : spec.env) env[kv.first] = kv.second;

    std::optional<std::string> child_path;
    if (auto it = env.find("PATH"); it != env.end()) child_path = it->second;
    auto exe = resolve_executable(out.argv[0], child_path);
    if (!exe) throw LaunchError(out.argv[0] + ": command not found");

    // Everything the child touches is built before fork(): only async-signal-safe calls after it.
    std::vector<std::string> env_strings; env_strings.reserve(env.size());
    for (auto &kv : env) env_strings.push_back(kv.first + "=" + kv.second);
    std::vector<char*> cenv; cenv.reserve(env_strings.size()+1);
    for (auto &s : env_strings) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);
    std::vector<char*> cargv; cargv.reserve(out.argv.size()+1);
    for (auto &s : out.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    const char* workdir = spec.working_dir ? spec.working_dir->c_str() : nullptr;

    FdGuard log_fd;
    if (spec.log_file) {
        log_fd.fd = ::open(spec.log_file->c_str(), O_WRONLY|O_CREAT|O_APPEND|O_CLOEXEC, 0644);
        if (log_fd.fd < 0) throw LaunchError(errno_message("open " + *spec.log_file, errno));
    }

    // exec failure is reported back as an errno over a close-on-exec pipe; EOF means exec succeeded.
    int p[2];
    if (::pipe2(p, O_CLOEXEC) != 0) throw LaunchError(errno_message("pipe", errno));
    FdGuard err_read(p[0]), err_write(p[1]);

    pid_t pid = ::fork();
    if (pid < 0) throw LaunchError(errno_message("fork", errno));
    if (pid == 0) {
        sigset_t none; sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int err = 0;
        if (::setsid() < 0) err = errno;
        if (!err && workdir && ::chdir(workdir) != 0) err = errno;
        if (!err && log_fd.fd >= 0) {
            if (::dup2(log_fd.fd, STDOUT_FILENO) < 0 || ::dup2(log_fd.fd, STDERR_FILENO) < 0) err = errno;
        }
        if (!err) {
            ::execve(exe->c_str(), cargv.data(), cenv.data());
            err = errno;
        }
        ssize_t ignored = ::write(err_write.fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(err_write.release());
    int child_errno = 0;
    ssize_t n;
    do { n = ::read(err_read.fd, &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int st = 0; while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        throw LaunchError(errno_message("cannot execute " + *exe, child_errno));
    }
    log::debug("launched pid ", pid, ": ", *exe);
    out.pid = pid;
    return out;
}

pid_t wait_for_group_leader(pid_t pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        pid_t pgid = ::getpgid(pid);
        if (pgid == pid) return pgid;
        if (pgid < 0 && errno == ESRCH) throw LaunchError("process " + std::to_string(pid) + " vanished before becoming group leader");
        if (std::chrono::steady_clock::now() >= deadline) {
            throw LaunchError("process " + std::to_string(pid) + " did not become group leader within "
                              + std::to_string(timeout.count()) + "ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace tasksup
