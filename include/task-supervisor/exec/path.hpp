/*
 * PATH resolution utilities - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace tasksup {

// Resolve command name to an absolute path. If cmd contains '/' it is checked as-is.
// search_path overrides $PATH (the child's PATH may differ from ours).
std::optional<std::string> resolve_executable(const std::string& cmd,
                                              const std::optional<std::string>& search_path = std::nullopt);

} // namespace tasksup
