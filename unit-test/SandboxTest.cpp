#include <chrono>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "runtime/sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace arena;

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        DEBUG = false;
    }

    void TearDown() override {
        DEBUG = false;
    }

    raw_result run_shell(const string &script, const string &input = "", int time_limit_ms = 2000,
                         const cancellation_token &token = cancellation_token()) {
        return box.run(script, test_languages().at("shell"), input, run_limits{time_limit_ms, 256}, token);
    }

    local_sandbox box{RUN_DIR};
};

TEST_F(SandboxTest, CapturesStdout) {
    auto result = run_shell("echo hello");
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.compile_failed);
    EXPECT_TRUE(result.error.empty());
}

TEST_F(SandboxTest, CapturesStderrAndExitCode) {
    auto result = run_shell("echo oops >&2\nexit 3");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_text, "oops\n");
    EXPECT_NE(result.error.find("exited with code 3"), string::npos);
    EXPECT_NE(result.error.find("oops"), string::npos);
}

TEST_F(SandboxTest, WritesInputToStdin) {
    auto result = run_shell("read a b\necho $((a + b))", "3 4\n");
    EXPECT_EQ(result.stdout_text, "7\n");
}

TEST_F(SandboxTest, LargeInput) {
    string input(1 << 20, 'x');
    auto result = run_shell("cat | wc -c", input, 5000);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(stoll(result.stdout_text), 1 << 20);
}

TEST_F(SandboxTest, TimeLimitKillsProcess) {
    auto start = chrono::steady_clock::now();
    auto result = run_shell("sleep 10", "", 200);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();

    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.error.find("Time limit exceeded"), string::npos);
    EXPECT_LT(elapsed, 3000);
}

TEST_F(SandboxTest, BackgroundChildrenAreKilled) {
    auto start = chrono::steady_clock::now();
    auto result = run_shell("sleep 10 &\necho done", "", 5000);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result.stdout_text, "done\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(elapsed, 4000);
}

TEST_F(SandboxTest, KilledBySignal) {
    auto result = run_shell("kill -9 $$");
    EXPECT_EQ(result.exit_code, 137);
    EXPECT_NE(result.error.find("signal 9"), string::npos);
}

TEST_F(SandboxTest, ArtifactDirectoryIsRemoved) {
    size_t before = count_entries(RUN_DIR);
    run_shell("echo hello > out.txt");
    EXPECT_EQ(count_entries(RUN_DIR), before);

    run_shell("exit 1");
    EXPECT_EQ(count_entries(RUN_DIR), before);

    run_shell("sleep 10", "", 100);
    EXPECT_EQ(count_entries(RUN_DIR), before);
}

TEST_F(SandboxTest, DebugKeepsArtifactDirectory) {
    size_t before = count_entries(RUN_DIR);
    DEBUG = true;
    run_shell("echo hello");
    EXPECT_EQ(count_entries(RUN_DIR), before + 1);
}

TEST_F(SandboxTest, RunsInArtifactDirectory) {
    auto result = run_shell("ls");
    EXPECT_EQ(result.stdout_text, "main.sh\n");
}

TEST_F(SandboxTest, MemoryIsEstimatedByDefault) {
    auto result = run_shell("echo hello");
    EXPECT_TRUE(result.memory_estimated);
    EXPECT_DOUBLE_EQ(result.memory_used_mb, 6 / (1024.0 * 1024.0));
}

TEST_F(SandboxTest, RlimitPolicyMeasuresMemory) {
    local_sandbox measured(RUN_DIR, make_shared<rlimit_policy>());
    auto result = measured.run("echo hello", test_languages().at("shell"), "", run_limits{2000, 256}, cancellation_token());
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_FALSE(result.memory_estimated);
    EXPECT_GT(result.memory_used_mb, 0);
}

TEST_F(SandboxTest, CancelFromAnotherThread) {
    cancellation_token token;
    thread canceller([token] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });

    auto start = chrono::steady_clock::now();
    auto result = run_shell("sleep 10", "", 8000, token);
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(elapsed, 4000);
}

TEST_F(SandboxTest, CancelledBeforeRun) {
    cancellation_token token;
    token.cancel();
    size_t before = count_entries(RUN_DIR);
    auto result = run_shell("echo hello", "", 2000, token);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.stdout_text.empty());
    EXPECT_EQ(count_entries(RUN_DIR), before);
}

TEST_F(SandboxTest, CompiledLanguage) {
    auto &language = test_languages().at("shell-compiled");
    auto result = box.run("echo compiled", language, "", run_limits{2000, 256}, cancellation_token());
    EXPECT_FALSE(result.compile_failed);
    EXPECT_EQ(result.stdout_text, "compiled\n");
}

TEST_F(SandboxTest, CompilationFailure) {
    auto &language = test_languages().at("shell-compiled");
    size_t before = count_entries(RUN_DIR);
    auto result = box.run("if then fi (", language, "", run_limits{2000, 256}, cancellation_token());
    EXPECT_TRUE(result.compile_failed);
    EXPECT_FALSE(result.compile_output.empty());
    EXPECT_TRUE(result.stdout_text.empty());
    EXPECT_NE(result.error.find("Compilation failed"), string::npos);
    EXPECT_EQ(count_entries(RUN_DIR), before);
}

TEST_F(SandboxTest, MissingExecutableIsInternalError) {
    interpreted_language missing("missing", "main.txt", "#", {"/nonexistent/interpreter", "{source}"});
    size_t before = count_entries(RUN_DIR);
    EXPECT_THROW(box.run("echo", missing, "", run_limits{2000, 256}, cancellation_token()), internal_error);
    EXPECT_EQ(count_entries(RUN_DIR), before);
}
