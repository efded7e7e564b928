/*
 * PATH resolution implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace tasksup {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::optional<std::string>& search_path) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    std::string paths;
    if (search_path) paths = *search_path;
    else if (const char* env = std::getenv("PATH")) paths = env;
    else paths = "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        std::string dir = paths.substr(start, colon == std::string::npos ? std::string::npos : colon-start);
        if (!dir.empty()) {
            std::string full = dir + '/' + cmd;
            if (is_executable(full)) return full;
        }
        if (colon == std::string::npos) break;
        start = colon+1;
    }
    return std::nullopt;
}

} // namespace tasksup
