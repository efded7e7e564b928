/*
 * Error helpers - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/util/errors.hpp>
#include <cstring>

namespace tasksup {

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

} // namespace tasksup
