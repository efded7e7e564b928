#include <gtest/gtest.h>
#include <task-supervisor/exec/launcher.hpp>
#include <task-supervisor/exec/monitor.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace tasksup;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public MetricsSink {
public:
    void gauge(const std::string& name, double value) override {
        std::lock_guard<std::mutex> lk(m);
        gauges[name].push_back(value);
    }
    void incr(const std::string& name, long count) override {
        std::lock_guard<std::mutex> lk(m);
        counters[name] += count;
    }
    std::size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lk(m);
        return gauges[name].size();
    }
    std::mutex m;
    std::map<std::string, std::vector<double>> gauges;
    std::map<std::string, long> counters;
};

class ThrowingSink : public MetricsSink {
public:
    void gauge(const std::string&, double) override { throw std::runtime_error("sink down"); }
    void incr(const std::string&, long) override {}
};

pid_t launch(std::vector<std::string> cmd) {
    ProcessLauncher launcher;
    LaunchSpec spec; spec.command = std::move(cmd);
    auto proc = launcher.launch(spec);
    wait_for_group_leader(proc.pid, 1000ms);
    return proc.pid;
}

void reap(pid_t pid) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds budget) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

} // namespace

TEST(ResourceMonitor, MemoryGrowsWithTheTask) {
    pid_t pid = launch({TASKSUP_TEST_GROW_EXEC, "8", "4096", "100", "300"});
    NullMetricsSink sink;
    ResourceMonitor mon(pid, "grow", sink, 1000ms);

    std::vector<long long> rss;
    while (true) {
        auto s = mon.sample();
        if (s.empty()) break;
        EXPECT_EQ(s.process_count, 1u);
        rss.push_back(s.rss_bytes);
        std::this_thread::sleep_for(100ms);
    }
    reap(pid);
    ASSERT_GE(rss.size(), 5u);
    for (std::size_t i = 1; i < rss.size(); ++i) {
        // allow a little allocator jitter between steps
        EXPECT_GE(rss[i] + 256 * 1024, rss[i-1]) << "sample " << i;
    }
    EXPECT_GE(rss.back() - rss.front(), 16LL * 1024 * 1024);
}

TEST(ResourceMonitor, SampleAfterExitIsEmpty) {
    pid_t pid = launch({"true"});
    reap(pid);
    NullMetricsSink sink;
    ResourceMonitor mon(pid, "gone", sink, 100ms);
    auto s = mon.sample();
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.rss_bytes, 0);
    EXPECT_EQ(s.cpu_percent, 0.0);
}

TEST(ResourceMonitor, BusyLoopShowsCpu) {
    pid_t pid = launch({"/bin/sh", "-c", "while :; do :; done"});
    NullMetricsSink sink;
    ResourceMonitor mon(pid, "busy", sink, 100ms);
    EXPECT_EQ(mon.sample().cpu_percent, 0.0);
    std::this_thread::sleep_for(500ms);
    EXPECT_GT(mon.sample().cpu_percent, 10.0);
    ::kill(pid, SIGKILL);
    reap(pid);
}

TEST(ResourceMonitor, PublishesBothGaugesEachTick) {
    pid_t pid = launch({"sleep", "5"});
    RecordingSink sink;
    ResourceMonitor mon(pid, "dag.task", sink, 100ms);
    EXPECT_EQ(mon.cpu_metric(), "task.cpu_usage.dag.task");
    EXPECT_EQ(mon.mem_metric(), "task.mem_usage.dag.task");
    mon.start();
    EXPECT_TRUE(wait_until([&]{ return mon.published_ticks() >= 3; }, 2000ms));

    auto before = std::chrono::steady_clock::now();
    mon.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 100ms);
    EXPECT_FALSE(mon.running());
    EXPECT_EQ(sink.count(mon.cpu_metric()), mon.published_ticks());
    EXPECT_EQ(sink.count(mon.mem_metric()), mon.published_ticks());
    EXPECT_GT(sink.gauges[mon.mem_metric()].front(), 0.0);

    ::kill(pid, SIGKILL);
    reap(pid);
}

TEST(ResourceMonitor, LoopEndsWhenGroupExits) {
    pid_t pid = launch({"sleep", "0.3"});
    RecordingSink sink;
    ResourceMonitor mon(pid, "short", sink, 50ms);
    testing::internal::CaptureStderr();
    mon.start();
    reap(pid);
    bool ended = wait_until([&]{ return !mon.running(); }, 2000ms);
    mon.stop();
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(ended);
    EXPECT_GE(mon.published_ticks(), 1u);
    EXPECT_NE(err.find("not found (most likely exited)"), std::string::npos) << err;
}

TEST(ResourceMonitor, SinkFailureStopsMonitoringOnly) {
    pid_t pid = launch({"sleep", "5"});
    ThrowingSink sink;
    ResourceMonitor mon(pid, "x", sink, 50ms);
    testing::internal::CaptureStderr();
    mon.start();
    bool ended = wait_until([&]{ return !mon.running(); }, 2000ms);
    mon.stop();
    testing::internal::GetCapturedStderr();
    EXPECT_TRUE(ended);
    EXPECT_EQ(::kill(pid, 0), 0);
    ::kill(pid, SIGKILL);
    reap(pid);
}
