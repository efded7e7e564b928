/*
 * Resource monitor implementation - Task Supervisor
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <task-supervisor/exec/monitor.hpp>
#include <task-supervisor/exec/proc_table.hpp>
#include <task-supervisor/util/log.hpp>
#include <exception>
#include <unistd.h>

namespace tasksup {

ResourceMonitor::ResourceMonitor(pid_t pgid, std::string metric_suffix, MetricsSink& sink,
                                 std::chrono::milliseconds interval)
    : m_pgid(pgid), m_suffix(std::move(metric_suffix)), m_sink(sink), m_interval(interval) {}

ResourceMonitor::~ResourceMonitor() { stop(); }

void ResourceMonitor::start() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_thread.joinable()) return;
    m_stop = false;
    m_running = true;
    m_thread = std::thread([this]{ loop(); });
}

void ResourceMonitor::stop() {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) m_thread.join();
}

ResourceSample ResourceMonitor::sample() {
    static const double clk_tck = static_cast<double>(::sysconf(_SC_CLK_TCK));
    std::lock_guard<std::mutex> lk(m_sample_mutex);
    auto now = std::chrono::steady_clock::now();
    double elapsed = m_last_sample.time_since_epoch().count() == 0 ? 0.0
                   : std::chrono::duration<double>(now - m_last_sample).count();
    ResourceSample s;
    std::map<pid_t, CpuMark> marks;
    for (auto &e : list_group(m_pgid)) {
        s.process_count++;
        s.rss_bytes += e.rss_bytes;
        auto prev = m_marks.find(e.pid);
        if (elapsed > 0 && clk_tck > 0 && prev != m_marks.end()
            && prev->second.start_time == e.start_time && e.cpu_ticks >= prev->second.ticks) {
            s.cpu_percent += (e.cpu_ticks - prev->second.ticks) / clk_tck / elapsed * 100.0;
        }
        marks[e.pid] = CpuMark{e.start_time, e.cpu_ticks};
    }
    m_marks.swap(marks);
    m_last_sample = now;
    return s;
}

void ResourceMonitor::loop() {
    try {
        while (true) {
            auto s = sample();
            if (s.empty()) {
                log::info("Process group ", m_pgid, " not found (most likely exited), stop collecting metrics");
                break;
            }
            m_sink.gauge(mem_metric(), static_cast<double>(s.rss_bytes));
            m_sink.gauge(cpu_metric(), s.cpu_percent);
            m_ticks++;
            std::unique_lock<std::mutex> lk(m_mutex);
            if (m_cv.wait_for(lk, m_interval, [this]{ return m_stop; })) break;
        }
    } catch (const std::exception& e) {
        // a sink failure ends monitoring, never the task
        log::warn("resource monitoring for group ", m_pgid, " stopped: ", e.what());
    }
    m_running = false;
}

} // namespace tasksup
