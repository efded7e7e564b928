/*
 * Metrics sink implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/util/metrics.hpp>
#include <task-supervisor/util/log.hpp>

namespace tasksup {

void LogMetricsSink::gauge(const std::string& name, double value) {
    log::debug("metric ", name, "=", value);
}

void LogMetricsSink::incr(const std::string& name, long count) {
    log::debug("metric ", name, "+=", count);
}

} // namespace tasksup
