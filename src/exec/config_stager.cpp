/*
 * Config stager implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/config_stager.hpp>
#include <task-supervisor/exec/launcher.hpp>
#include <task-supervisor/util/errors.hpp>
#include <task-supervisor/util/log.hpp>
#include <cerrno>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tasksup {

int run_helper_sync(const std::vector<std::string>& argv) {
    if (argv.empty()) return -1;
    std::vector<char*> cargv; cargv.reserve(argv.size()+1);
    for (auto &s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(), environ);
    if (rc != 0) { log::error(errno_message("posix_spawnp " + argv[0], rc)); return -1; }
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) { log::error(errno_message("waitpid " + argv[0], errno)); return -1; }
    }
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    return 128 + (WIFSIGNALED(st) ? WTERMSIG(st) : 0);
}

static bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data()+off, data.size()-off);
        if (n < 0) { if (errno == EINTR) continue; return false; }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::string ConfigStager::stage(const Config& cfg, bool include_env, bool include_cmds,
                                const std::optional<std::string>& run_as_user) const {
    std::string path = m_dir + "/tasksup_cfg_XXXXXX";
    int fd = ::mkstemp(path.data());
    if (fd < 0) throw LaunchError(errno_message("mkstemp " + m_dir, errno));
    // mkstemp already uses 0600 on glibc; do not rely on it
    if (::fchmod(fd, S_IRUSR|S_IWUSR) != 0) {
        int err = errno; ::close(fd); unstage(path);
        throw LaunchError(errno_message("fchmod " + path, err));
    }
    bool ok = write_all(fd, to_rc_text(cfg.as_map(include_env, include_cmds)));
    int err = errno;
    if (::close(fd) != 0 && ok) { ok = false; err = errno; }
    if (!ok) { unstage(path); throw LaunchError(errno_message("write " + path, err)); }

    if (needs_identity_switch(run_as_user)) {
        auto argv = chown_argv(*run_as_user, path);
        int rc = run_helper_sync(argv);
        if (rc != 0) {
            unstage(path);
            throw LaunchError("cannot hand staged config to " + *run_as_user + ": '" + argv[0]
                              + " chown' exited with " + std::to_string(rc));
        }
    }
    log::debug("staged config at ", path);
    return path;
}

void ConfigStager::unstage(const std::string& path) {
    if (path.empty()) return;
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        log::warn(errno_message("cannot remove staged config " + path, errno));
    }
}

} // namespace tasksup
