/*
 * Resource monitor - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <task-supervisor/util/metrics.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>

namespace tasksup {

// Aggregate over every live process of a group at one instant. process_count == 0 means the
// group was already gone, which is a valid sample.
struct ResourceSample {
    double cpu_percent = 0.0;
    long long rss_bytes = 0;
    std::size_t process_count = 0;

    bool empty() const { return process_count == 0; }
};

// Samples a process group on a fixed interval from a background thread and publishes
//   task.cpu_usage.<suffix>   (percent of one CPU, summed over the group)
//   task.mem_usage.<suffix>   (resident bytes, summed over the group)
// The loop ends by itself once a tick finds the group empty, or when stop() is called; the
// wait between ticks wakes up immediately on stop().
class ResourceMonitor {
public:
    ResourceMonitor(pid_t pgid, std::string metric_suffix, MetricsSink& sink,
                    std::chrono::milliseconds interval);
    ~ResourceMonitor();

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    void start();
    void stop();

    // One measurement, not published. CPU% is relative to the previous sample() of the same
    // pid; a pid seen for the first time counts 0%.
    ResourceSample sample();

    bool running() const { return m_running.load(); }
    std::size_t published_ticks() const { return m_ticks.load(); }
    std::string cpu_metric() const { return "task.cpu_usage." + m_suffix; }
    std::string mem_metric() const { return "task.mem_usage." + m_suffix; }

private:
    void loop();

    struct CpuMark {
        unsigned long long start_time = 0;
        unsigned long long ticks = 0;
    };

    pid_t m_pgid;
    std::string m_suffix;
    MetricsSink& m_sink;
    std::chrono::milliseconds m_interval;

    std::mutex m_sample_mutex;
    std::map<pid_t, CpuMark> m_marks;
    std::chrono::steady_clock::time_point m_last_sample{};

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop = false;
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_ticks{0};
    std::thread m_thread;
};

} // namespace tasksup
