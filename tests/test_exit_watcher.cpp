#include <gtest/gtest.h>
#include <task-supervisor/exec/exit_watcher.hpp>
#include <task-supervisor/exec/launcher.hpp>
#include <task-supervisor/util/errors.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace tasksup;
using namespace std::chrono_literals;

static pid_t launch_sh(const std::string& script) {
    ProcessLauncher launcher;
    LaunchSpec spec; spec.command = {"/bin/sh", "-c", script};
    return launcher.launch(spec).pid;
}

TEST(ExitWatcher, ExitCodes) {
    SignalLedger ledger;
    for (int code : {0, 1, 42}) {
        ExitWatcher w(launch_sh("exit " + std::to_string(code)), ledger, "exit");
        auto out = w.wait();
        EXPECT_EQ(out.return_code, code);
        EXPECT_EQ(out.cause, (TerminationCause{TerminationCause::Kind::Exited, code}));
    }
}

TEST(ExitWatcher, ResultIsCachedAndCallbackRunsOnce) {
    SignalLedger ledger;
    int calls = 0;
    ExitWatcher w(launch_sh("exit 7"), ledger, "cached", [&](const ExitOutcome& o){ calls++; EXPECT_EQ(o.return_code, 7); });
    EXPECT_FALSE(w.result().has_value());
    EXPECT_EQ(w.wait().return_code, 7);
    EXPECT_TRUE(w.done());
    EXPECT_EQ(w.wait().return_code, 7);
    EXPECT_EQ(w.wait(10ms).return_code, 7);
    EXPECT_EQ(w.poll()->return_code, 7);
    EXPECT_EQ(calls, 1);
}

TEST(ExitWatcher, TimeoutLeavesChildRunning) {
    SignalLedger ledger;
    pid_t pid = launch_sh("sleep 1");
    ExitWatcher w(pid, ledger, "slow");
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(w.wait(100ms), TerminationTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 100ms);
    EXPECT_FALSE(w.done());
    EXPECT_EQ(::kill(pid, 0), 0);
    EXPECT_FALSE(w.poll().has_value());
    // retry with enough time succeeds
    EXPECT_EQ(w.wait(5000ms).return_code, 0);
}

TEST(ExitWatcher, ExternalKillIsReported) {
    SignalLedger ledger;
    pid_t pid = launch_sh("sleep 30");
    ExitWatcher w(pid, ledger, "victim");
    ::kill(pid, SIGKILL);
    testing::internal::CaptureStderr();
    auto out = w.wait();
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.return_code, -9);
    EXPECT_EQ(out.cause.kind, TerminationCause::Kind::SignaledExternally);
    EXPECT_NE(err.find("likely due to running out of memory"), std::string::npos) << err;
    EXPECT_NE(err.find("victim"), std::string::npos);
}

TEST(ExitWatcher, SupervisorSignalIsNotExternal) {
    SignalLedger ledger;
    pid_t pid = launch_sh("sleep 30");
    ExitWatcher w(pid, ledger, "ours");
    ledger.record(SIGTERM);
    ::kill(pid, SIGTERM);
    testing::internal::CaptureStderr();
    auto out = w.wait();
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.return_code, -SIGTERM);
    EXPECT_EQ(out.cause, (TerminationCause{TerminationCause::Kind::SignaledBySupervisor, SIGTERM}));
    EXPECT_EQ(err.find("running out of memory"), std::string::npos) << err;
}

TEST(ExitWatcher, ReapedElsewhereCountsAsKill) {
    SignalLedger ledger;
    pid_t pid = launch_sh("exit 0");
    int st = 0;
    ASSERT_EQ(::waitpid(pid, &st, 0), pid);
    ExitWatcher w(pid, ledger, "stolen");
    testing::internal::CaptureStderr();
    auto out = w.poll();
    testing::internal::GetCapturedStderr();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->return_code, -SIGKILL);
    EXPECT_EQ(out->cause.kind, TerminationCause::Kind::SignaledExternally);
}

TEST(ExitWatcher, ConcurrentWaitersAgree) {
    SignalLedger ledger;
    std::atomic<int> calls{0};
    ExitWatcher w(launch_sh("sleep 0.2; exit 5"), ledger, "shared", [&](const ExitOutcome&){ calls++; });
    std::vector<std::thread> threads;
    std::atomic<int> fives{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]{
            auto out = (i % 2) ? w.wait() : w.wait(5000ms);
            if (out.return_code == 5) fives++;
        });
    }
    for (auto &t : threads) t.join();
    EXPECT_EQ(fives.load(), 4);
    EXPECT_EQ(calls.load(), 1);
}

TEST(TerminationCause, Describe) {
    EXPECT_EQ(describe({TerminationCause::Kind::Exited, 3}), "exited with 3");
    EXPECT_EQ(describe({TerminationCause::Kind::SignaledBySupervisor, SIGTERM}), "terminated by supervisor with SIGTERM");
    EXPECT_EQ(describe({TerminationCause::Kind::SignaledExternally, SIGKILL}), "killed externally by SIGKILL");
}
