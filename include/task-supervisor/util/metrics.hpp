/*
 * Metrics sink - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace tasksup {

class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void gauge(const std::string& name, double value) = 0;
    virtual void incr(const std::string& name, long count = 1) = 0;
};

class NullMetricsSink : public MetricsSink {
public:
    void gauge(const std::string&, double) override {}
    void incr(const std::string&, long) override {}
};

// Emits "metric <name>=<value>" at debug level.
class LogMetricsSink : public MetricsSink {
public:
    void gauge(const std::string& name, double value) override;
    void incr(const std::string& name, long count) override;
};

} // namespace tasksup
