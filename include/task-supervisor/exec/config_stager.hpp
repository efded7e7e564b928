/*
 * Config stager - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <task-supervisor/util/config.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tasksup {

// Writes a private copy of the run configuration for the child to read.
class ConfigStager {
public:
    ConfigStager(std::string staging_dir, std::string privilege_helper)
        : m_dir(std::move(staging_dir)), m_helper(std::move(privilege_helper)) {}

    // Creates the file with mode 0600 before writing anything to it. When run_as_user is
    // another user, hands it over with "<helper> chown <user> <path>"; that failing throws
    // LaunchError and the file is removed.
    std::string stage(const Config& cfg, bool include_env, bool include_cmds,
                      const std::optional<std::string>& run_as_user = std::nullopt) const;

    // Idempotent; a missing file is fine.
    static void unstage(const std::string& path);

    std::vector<std::string> chown_argv(const std::string& user, const std::string& path) const {
        return {m_helper, "chown", user, path};
    }

private:
    std::string m_dir;
    std::string m_helper;
};

// posix_spawnp + waitpid; returns the exit status, or -1 if the helper could not run.
int run_helper_sync(const std::vector<std::string>& argv);

} // namespace tasksup
