#include <gtest/gtest.h>
#include <task-supervisor/exec/launcher.hpp>
#include <task-supervisor/util/errors.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace tasksup;
using namespace std::chrono_literals;

static std::string tmp_path(const char* tag) {
    return "/tmp/tasksup_" + std::string(tag) + "_" + std::to_string(::getpid());
}

static std::string slurp(const std::string& p) {
    std::ifstream in(p); std::ostringstream oss; oss << in.rdbuf(); return oss.str();
}

static int reap(pid_t pid) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    return WIFEXITED(st) ? WEXITSTATUS(st) : -WTERMSIG(st);
}

TEST(Launcher, ChildBecomesGroupLeader) {
    ProcessLauncher launcher;
    LaunchSpec spec; spec.command = {"sleep", "5"};
    auto proc = launcher.launch(spec);
    ASSERT_GT(proc.pid, 0);
    EXPECT_EQ(wait_for_group_leader(proc.pid, 1000ms), proc.pid);
    EXPECT_NE(::getpgid(proc.pid), ::getpgrp());
    EXPECT_EQ(::getsid(proc.pid), proc.pid);
    ::kill(proc.pid, SIGKILL);
    EXPECT_EQ(reap(proc.pid), -SIGKILL);
}

TEST(Launcher, EmptyCommandIsLaunchError) {
    ProcessLauncher launcher;
    EXPECT_THROW(launcher.launch(LaunchSpec{}), LaunchError);
}

TEST(Launcher, MissingBinaryIsLaunchError) {
    ProcessLauncher launcher;
    LaunchSpec spec; spec.command = {"tasksup-definitely-not-a-command"};
    EXPECT_THROW(launcher.launch(spec), LaunchError);
    spec.command = {"/nonexistent/bin/tool"};
    EXPECT_THROW(launcher.launch(spec), LaunchError);
}

TEST(Launcher, BadWorkingDirIsReportedFromChild) {
    ProcessLauncher launcher;
    LaunchSpec spec; spec.command = {"true"};
    spec.working_dir = "/nonexistent_tasksup_dir";
    try {
        launcher.launch(spec);
        FAIL() << "expected LaunchError";
    } catch (const LaunchError& e) {
        EXPECT_NE(std::string(e.what()).find("No such file"), std::string::npos) << e.what();
    }
}

TEST(Launcher, BuildArgvAddsIdentityPrefixForOtherUser) {
    ProcessLauncher launcher("doas");
    LaunchSpec spec; spec.command = {"echo", "hi"};
    EXPECT_EQ(launcher.build_argv(spec), (std::vector<std::string>{"echo", "hi"}));

    std::string other = current_user() == "nobody" ? "root" : "nobody";
    spec.run_as_user = other;
    EXPECT_EQ(launcher.build_argv(spec),
              (std::vector<std::string>{"doas", "-E", "-H", "-u", other, "--", "echo", "hi"}));

    spec.run_as_user = current_user();
    EXPECT_EQ(launcher.build_argv(spec), (std::vector<std::string>{"echo", "hi"}));
}

TEST(Launcher, NeedsIdentitySwitch) {
    EXPECT_FALSE(needs_identity_switch(std::nullopt));
    EXPECT_FALSE(needs_identity_switch(std::string()));
    EXPECT_FALSE(needs_identity_switch(current_user()));
    EXPECT_TRUE(needs_identity_switch(std::string("tasksup-no-such-user")));
}

TEST(Launcher, EnvWorkdirAndLogFile) {
    auto log = tmp_path("launch_log");
    ::unlink(log.c_str());
    ProcessLauncher launcher;
    LaunchSpec spec;
    spec.command = {"/bin/sh", "-c", "echo \"$TASKSUP_T1:$(pwd)\"; echo err >&2"};
    spec.env = {{"TASKSUP_T1", "first"}, {"TASKSUP_T1", "second"}};
    spec.working_dir = "/";
    spec.log_file = log;
    auto proc = launcher.launch(spec);
    EXPECT_EQ(reap(proc.pid), 0);
    EXPECT_EQ(slurp(log), "second:/\nerr\n");
    ::unlink(log.c_str());
}

TEST(Launcher, RunAsGoesThroughHelper) {
    // stand-in helper: drops everything up to "--" and execs the rest
    auto helper = tmp_path("helper");
    {
        std::ofstream out(helper);
        out << "#!/bin/sh\nwhile [ \"$1\" != \"--\" ]; do shift; done\nshift\nexec \"$@\"\n";
    }
    ::chmod(helper.c_str(), 0700);
    auto log = tmp_path("helper_log");
    ::unlink(log.c_str());

    ProcessLauncher launcher(helper);
    LaunchSpec spec;
    spec.command = {"echo", "as-other"};
    spec.run_as_user = "tasksup-no-such-user";
    spec.log_file = log;
    auto proc = launcher.launch(spec);
    EXPECT_EQ(proc.argv.front(), helper);
    EXPECT_EQ(wait_for_group_leader(proc.pid, 1000ms), proc.pid);
    EXPECT_EQ(reap(proc.pid), 0);
    EXPECT_EQ(slurp(log), "as-other\n");
    ::unlink(log.c_str());
    ::unlink(helper.c_str());
}

TEST(Launcher, GroupLeaderWaitFailsForVanishedPid) {
    ProcessLauncher launcher;
    LaunchSpec spec; spec.command = {"true"};
    auto proc = launcher.launch(spec);
    reap(proc.pid);
    EXPECT_THROW(wait_for_group_leader(proc.pid, 100ms), LaunchError);
}
