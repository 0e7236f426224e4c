#include <gtest/gtest.h>
#include "core/process_executor.hpp"
#include "test_base.hpp"
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <signal.h>
#include <thread>

class ProcessExecutorTest : public TestBase
{
protected:
    ExecutionOptions fastOptions() const
    {
        ExecutionOptions options;
        options.sample_interval = std::chrono::milliseconds(20);
        return options;
    }

    // A zombie waiting for its new parent to reap it counts as gone
    static bool isRunning(pid_t pid)
    {
        std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (!std::getline(in, line))
        {
            return false;
        }
        auto comm_end = line.rfind(')');
        return comm_end != std::string::npos && comm_end + 2 < line.size() && line[comm_end + 2] != 'Z';
    }

    static bool waitUntilGone(pid_t pid, std::chrono::milliseconds limit)
    {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (isRunning(pid))
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return true;
    }

    pid_t readPidFile(const std::string &name) const
    {
        std::ifstream in(std::filesystem::path(getTestDir()) / name);
        long pid = 0;
        in >> pid;
        return static_cast<pid_t>(pid);
    }

    ProcessExecutor executor_;
};

TEST_F(ProcessExecutorTest, CapturesExitCodeAndOutput)
{
    installTool("greeter", "echo \"hello $1\"\necho 'to stderr' >&2\nexit 3");

    StageResult result = executor_.run("greet", "greeter", {"world"}, getTestDir(), fastOptions());

    EXPECT_EQ(result.launch_status, LaunchStatus::LAUNCHED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.output.find("hello world"), std::string::npos);
    EXPECT_NE(result.output.find("to stderr"), std::string::npos);
    EXPECT_EQ(result.stage_name, "greet");
    EXPECT_EQ(result.command_line, "greeter world");
}

TEST_F(ProcessExecutorTest, ZeroExitSucceeds)
{
    installTool("ok-tool", "exit 0");

    StageResult result = executor_.run("ok", "ok-tool", {}, getTestDir());

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.cancelled);
}

TEST_F(ProcessExecutorTest, MissingExecutableIsReportedNotThrown)
{
    StageResult result = executor_.run("missing", "no-such-tool-avif-test", {"--version"}, getTestDir());

    EXPECT_EQ(result.launch_status, LaunchStatus::EXECUTABLE_NOT_FOUND);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.executable, "no-such-tool-avif-test");
}

TEST_F(ProcessExecutorTest, NonExecutableFileIsNotResolved)
{
    std::filesystem::path plain = std::filesystem::path(binDir()) / "not-executable";
    std::ofstream(plain) << "data";
    std::filesystem::permissions(plain, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    EXPECT_FALSE(ProcessExecutor::resolveExecutable("not-executable").has_value());
}

TEST_F(ProcessExecutorTest, ResolvesAgainstPath)
{
    installTool("findme", "exit 0");

    auto resolved = ProcessExecutor::resolveExecutable("findme");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(std::filesystem::path(*resolved).filename(), "findme");
    EXPECT_FALSE(ProcessExecutor::resolveExecutable("").has_value());
}

TEST_F(ProcessExecutorTest, RunsInGivenWorkingDirectory)
{
    installTool("where", "pwd");

    StageResult result = executor_.run("pwd", "where", {}, scratchDir());

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(std::filesystem::canonical(result.output.substr(0, result.output.find('\n'))),
              std::filesystem::canonical(scratchDir()));
}

TEST_F(ProcessExecutorTest, TimeoutKillsChild)
{
    installTool("sleeper", "exec sleep 30");

    ExecutionOptions options = fastOptions();
    options.timeout = std::chrono::milliseconds(300);

    auto started = std::chrono::steady_clock::now();
    StageResult result = executor_.run("sleep", "sleeper", {}, getTestDir(), options);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(ProcessExecutorTest, CancellationKillsChild)
{
    installTool("sleeper", "exec sleep 30");

    CancellationToken token;
    ExecutionOptions options = fastOptions();
    options.cancel_token = &token;

    std::thread canceller([&token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel(); });

    auto started = std::chrono::steady_clock::now();
    StageResult result = executor_.runMonitored("sleep", "sleeper", {}, getTestDir(), options);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(ProcessExecutorTest, TimeoutKillsHelpersOfWrapperScript)
{
    // The shell stays alive and its sleep inherits the output pipe
    installTool("wrapper", "sleep 30\necho done");

    ExecutionOptions options = fastOptions();
    options.timeout = std::chrono::milliseconds(300);

    auto started = std::chrono::steady_clock::now();
    StageResult result = executor_.run("wrap", "wrapper", {}, getTestDir(), options);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.output.find("done"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ProcessExecutorTest, CancellationKillsHelpersOfWrapperScript)
{
    installTool("wrapper", "sleep 30 &\necho $! > helper.pid\nwait\necho done");

    CancellationToken token;
    ExecutionOptions options = fastOptions();
    options.cancel_token = &token;

    std::thread canceller([&token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        token.cancel(); });

    auto started = std::chrono::steady_clock::now();
    StageResult result = executor_.runMonitored("wrap", "wrapper", {}, getTestDir(), options);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    pid_t helper = readPidFile("helper.pid");
    ASSERT_GT(helper, 0);
    EXPECT_TRUE(waitUntilGone(helper, std::chrono::seconds(2))) << "helper pid " << helper << " survived";
}

TEST_F(ProcessExecutorTest, ExitDoesNotWaitForBackgroundHelper)
{
    // Exits at once while a background sleep keeps the output pipe open
    installTool("forker", "sleep 30 &\necho $! > helper.pid\necho started");

    ExecutionOptions options = fastOptions();
    options.output_drain_timeout = std::chrono::milliseconds(200);

    auto started = std::chrono::steady_clock::now();
    StageResult result = executor_.run("fork", "forker", {}, getTestDir(), options);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.succeeded()) << result.output;
    EXPECT_NE(result.output.find("started"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    pid_t helper = readPidFile("helper.pid");
    if (helper > 0 && isRunning(helper))
    {
        ::kill(helper, SIGKILL);
    }
}

TEST_F(ProcessExecutorTest, MonitoredRunSamplesChildMemory)
{
    installTool("busy", "exec sleep 0.5");

    StageResult result = executor_.runMonitored("busy", "busy", {}, getTestDir(), fastOptions());

    ASSERT_TRUE(result.succeeded()) << result.output;
    EXPECT_GT(result.sample_count, 0u);
    EXPECT_GT(result.peak_rss_bytes, 0u);
    EXPECT_GE(result.duration.count(), 400);
}

TEST_F(ProcessExecutorTest, MonitoredRunSamplesWrapperScriptTree)
{
    installTool("busy", "sleep 0.5\nexit 0");

    StageResult result = executor_.runMonitored("busy", "busy", {}, getTestDir(), fastOptions());

    ASSERT_TRUE(result.succeeded()) << result.output;
    EXPECT_GT(result.sample_count, 0u);
    EXPECT_GT(result.peak_rss_bytes, 0u);
}

TEST_F(ProcessExecutorTest, PeakMemoryIsTheToolsNotOurs)
{
    // Make this process far larger than the tool so a copy of it would show
    const size_t ballast_bytes = 256u * 1024 * 1024;
    std::unique_ptr<char[]> ballast(new char[ballast_bytes]);
    std::memset(ballast.get(), 0x5A, ballast_bytes);
    ASSERT_GT(ResourceMonitor::sampleSelf().rss_bytes, ballast_bytes);

    installTool("small", "exec sleep 0.3");

    StageResult result = executor_.runMonitored("small", "small", {}, getTestDir(), fastOptions());

    ASSERT_TRUE(result.succeeded()) << result.output;
    EXPECT_GT(result.sample_count, 0u);
    EXPECT_LT(result.peak_rss_bytes, ballast_bytes / 2);
    EXPECT_EQ(ballast[ballast_bytes - 1], 0x5A);
}

TEST_F(ProcessExecutorTest, MonitoredRunRecordsMinimumAvailableMemory)
{
    installTool("busy", "exec sleep 0.2");

    StageResult result = executor_.runMonitored("busy", "busy", {}, getTestDir(), fastOptions());

    ASSERT_TRUE(result.succeeded()) << result.output;
    if (result.memory_before.system_total_bytes == 0)
    {
        GTEST_SKIP() << "/proc/meminfo not readable";
    }
    EXPECT_GT(result.min_system_available_bytes, 0u);
    EXPECT_LE(result.min_system_available_bytes, result.memory_before.system_available_bytes);
    EXPECT_LE(result.min_system_available_bytes, result.memory_after.system_available_bytes);
}

TEST_F(ProcessExecutorTest, UnmonitoredRunTakesNoSamples)
{
    installTool("quick", "exit 0");

    StageResult result = executor_.run("quick", "quick", {}, getTestDir());

    EXPECT_EQ(result.sample_count, 0u);
    EXPECT_EQ(result.peak_rss_bytes, 0u);
}

TEST_F(ProcessExecutorTest, CommandLineQuotesArgumentsWithSpaces)
{
    EXPECT_EQ(ProcessExecutor::formatCommandLine("avifenc", {"in file.jpg", "out.avif"}),
              "avifenc 'in file.jpg' out.avif");
}
