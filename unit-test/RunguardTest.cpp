#include <chrono>
#include <system_error>
#include <thread>
#include "gtest/gtest.h"
#include "run.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

static runguard_options shell(const string &script) {
    runguard_options opt;
    opt.command = {"/bin/sh", "-c", script};
    return opt;
}

TEST(RunguardTest, CapturesOutputAndExitCode) {
    runguard_result result = runit(shell("echo hello; echo oops >&2; exit 3"));
    EXPECT_EQ("hello\n", result.stdout_data);
    EXPECT_EQ("oops\n", result.stderr_data);
    EXPECT_EQ(3, result.exitcode);
    EXPECT_EQ(-1, result.signal);
    EXPECT_FALSE(result.crashed());
    EXPECT_FALSE(result.wall_timeout);
    EXPECT_GE(result.wall_time, 0);
}

TEST(RunguardTest, ReportsSignal) {
    runguard_result result = runit(shell("kill -9 $$"));
    EXPECT_EQ(9, result.signal);
    EXPECT_EQ(128 + 9, result.exitcode);
    EXPECT_TRUE(result.crashed());
}

TEST(RunguardTest, WallTimeLimit) {
    runguard_options opt = shell("sleep 10");
    opt.use_wall_limit = true;
    opt.wall_limit = {0.5, 0.5};

    auto start = chrono::steady_clock::now();
    runguard_result result = runit(opt);
    auto elapsed = chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.wall_timeout);
    EXPECT_FALSE(result.crashed());
    EXPECT_LT(elapsed, chrono::seconds(5));
}

TEST(RunguardTest, KillsWholeProcessGroup) {
    path dir = make_test_directory("runguard");
    runguard_options opt = shell("(sleep 1; touch leaked) & sleep 10");
    opt.work_dir = dir.string();
    opt.use_wall_limit = true;
    opt.wall_limit = {0.3, 0.3};

    runguard_result result = runit(opt);
    EXPECT_TRUE(result.wall_timeout);
    this_thread::sleep_for(chrono::milliseconds(1500));
    EXPECT_FALSE(exists(dir / "leaked"));

    remove_all(dir);
}

TEST(RunguardTest, Cancellation) {
    cancellation_token cancel;
    runguard_options opt = shell("sleep 10");
    opt.cancel = &cancel;

    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(300));
        cancel.cancel();
    });

    auto start = chrono::steady_clock::now();
    runguard_result result = runit(opt);
    auto elapsed = chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.wall_timeout);
    EXPECT_FALSE(result.crashed());
    EXPECT_LT(elapsed, chrono::seconds(5));
}

TEST(RunguardTest, TruncatesStreams) {
    runguard_options opt = shell("i=0; while [ $i -lt 100 ]; do echo 0123456789; i=$((i+1)); done");
    opt.stream_size = 25;
    runguard_result result = runit(opt);

    EXPECT_EQ(25u, result.stdout_data.size());
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
    EXPECT_EQ(0, result.exitcode);
}

TEST(RunguardTest, EventChannel) {
    string events;
    runguard_options opt = shell("echo first >&3; echo output; echo second >&3");
    opt.event_sink = [&](const char *data, size_t size) { events.append(data, size); };

    runguard_result result = runit(opt);
    EXPECT_EQ("first\nsecond\n", events);
    EXPECT_EQ("output\n", result.stdout_data);
    EXPECT_EQ(0, result.exitcode);
}

TEST(RunguardTest, EventChannelClosedWithoutSink) {
    runguard_result result = runit(shell("echo hi >&3"));
    EXPECT_NE(0, result.exitcode);
}

TEST(RunguardTest, WorkDirAndEnvironment) {
    path dir = make_test_directory("runguard");
    setenv("GRADER_RUNGUARD_SECRET", "leaked", 1);

    runguard_options opt = shell("pwd; echo \"[$GRADER_RUNGUARD_SECRET]\"; echo \"[$GRADER_VISIBLE]\"");
    opt.work_dir = dir.string();
    opt.env = {"GRADER_VISIBLE=yes"};
    runguard_result result = runit(opt);

    EXPECT_EQ(canonical(dir).string() + "\n[]\n[yes]\n", result.stdout_data);

    unsetenv("GRADER_RUNGUARD_SECRET");
    remove_all(dir);
}

TEST(RunguardTest, FileSizeLimit) {
    path dir = make_test_directory("runguard");
    runguard_options opt = shell("head -c 100000 /dev/zero > big; echo done");
    opt.work_dir = dir.string();
    opt.file_limit = 1000;
    opt.no_core_dumps = true;

    runguard_result result = runit(opt);
    EXPECT_LE(file_size(dir / "big"), 1000u);
    EXPECT_EQ("done\n", result.stdout_data);

    remove_all(dir);
}

TEST(RunguardTest, StartFailures) {
    runguard_options missing;
    missing.command = {"grader-command-that-does-not-exist"};
    EXPECT_THROW(runit(missing), system_error);

    runguard_options bad_dir = shell("true");
    bad_dir.work_dir = "/nonexistent/grader/workdir";
    EXPECT_THROW(runit(bad_dir), system_error);

    runguard_options empty;
    EXPECT_THROW(runit(empty), invalid_argument);
}
