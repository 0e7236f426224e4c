#include "core/process_executor.hpp"
#include "logging/logger.hpp"
#include <Poco/Environment.h>
#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <Poco/Pipe.h>
#include <Poco/Process.h>
#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <signal.h>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace
{
    bool isExecutableFile(const std::string &path)
    {
        try
        {
            Poco::File file(path);
            return file.exists() && file.isFile() && file.canExecute();
        }
        catch (const Poco::Exception &)
        {
            return false;
        }
    }

    // Output of the child, filled by the reader thread. Shared so that a reader
    // still blocked on a pipe held open elsewhere can be left behind safely.
    struct OutputCapture
    {
        explicit OutputCapture(const Poco::Pipe &source) : pipe(source) {}

        Poco::Pipe pipe;
        std::mutex mutex;
        std::condition_variable done_cv;
        std::string text;
        bool done = false;
    };

    void drainPipe(const std::shared_ptr<OutputCapture> &capture)
    {
        char buffer[4096];
        try
        {
            for (;;)
            {
                int n = capture->pipe.readBytes(buffer, static_cast<int>(sizeof(buffer)));
                if (n <= 0)
                {
                    break;
                }
                std::lock_guard<std::mutex> lock(capture->mutex);
                capture->text.append(buffer, static_cast<size_t>(n));
            }
        }
        catch (const Poco::Exception &e)
        {
            std::lock_guard<std::mutex> lock(capture->mutex);
            capture->text += "\n[output capture interrupted: " + e.displayText() + "]";
        }
        {
            std::lock_guard<std::mutex> lock(capture->mutex);
            capture->done = true;
        }
        capture->done_cv.notify_all();
    }

    bool waitForDrain(const std::shared_ptr<OutputCapture> &capture, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(capture->mutex);
        return capture->done_cv.wait_for(lock, timeout, [&capture]()
                                         { return capture->done; });
    }

    void killGroup(pid_t group)
    {
        if (::kill(-group, SIGKILL) != 0 && errno != ESRCH)
        {
            Logger::warn("ProcessExecutor: kill of process group " + std::to_string(group) + " failed: " + std::strerror(errno));
        }
    }

    // Kill the child along with its process tree, then reap it.
    // Descendants are collected first; once the child dies they are reparented
    // and can no longer be told apart from unrelated processes.
    int killTreeAndReap(Poco::ProcessHandle &handle, bool own_group)
    {
        const pid_t pid = static_cast<pid_t>(handle.id());
        std::vector<pid_t> descendants = ResourceMonitor::listDescendants(pid);

        if (own_group)
        {
            killGroup(pid);
        }
        try
        {
            Poco::Process::kill(handle);
        }
        catch (const Poco::Exception &e)
        {
            Logger::debug("ProcessExecutor: kill of pid " + std::to_string(pid) + " failed: " + e.displayText());
        }
        for (pid_t descendant : descendants)
        {
            if (::kill(descendant, SIGKILL) != 0 && errno != ESRCH)
            {
                Logger::warn("ProcessExecutor: kill of descendant " + std::to_string(descendant) + " failed: " + std::strerror(errno));
            }
        }
        return handle.wait();
    }
}

const char *launchStatusToString(LaunchStatus status)
{
    switch (status)
    {
    case LaunchStatus::LAUNCHED:
        return "launched";
    case LaunchStatus::EXECUTABLE_NOT_FOUND:
        return "executable_not_found";
    case LaunchStatus::LAUNCH_FAILED:
        return "launch_failed";
    }
    return "unknown";
}

std::optional<std::string> ProcessExecutor::resolveExecutable(const std::string &name)
{
    if (name.empty())
    {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos)
    {
        if (isExecutableFile(name))
        {
            return Poco::Path(name).absolute().toString();
        }
        return std::nullopt;
    }

    // Path::find stops at the first match, which may be a non-executable file,
    // so walk the entries ourselves.
    std::string path_list = Poco::Environment::get("PATH", "");
    std::istringstream entries(path_list);
    std::string dir;
    while (std::getline(entries, dir, Poco::Path::pathSeparator()))
    {
        if (dir.empty())
        {
            continue;
        }
        Poco::Path candidate(Poco::Path::forDirectory(dir), name);
        std::string candidate_path = candidate.toString();
        if (isExecutableFile(candidate_path))
        {
            return candidate.absolute().toString();
        }
    }
    return std::nullopt;
}

std::string ProcessExecutor::formatCommandLine(const std::string &executable, const std::vector<std::string> &args)
{
    std::string line = executable;
    for (const auto &arg : args)
    {
        line += ' ';
        if (arg.find(' ') != std::string::npos)
        {
            line += "'" + arg + "'";
        }
        else
        {
            line += arg;
        }
    }
    return line;
}

StageResult ProcessExecutor::run(const std::string &stage_name,
                                 const std::string &executable,
                                 const std::vector<std::string> &args,
                                 const std::string &workdir,
                                 const ExecutionOptions &options) const
{
    return execute(stage_name, executable, args, workdir, options, false);
}

StageResult ProcessExecutor::runMonitored(const std::string &stage_name,
                                          const std::string &executable,
                                          const std::vector<std::string> &args,
                                          const std::string &workdir,
                                          const ExecutionOptions &options) const
{
    return execute(stage_name, executable, args, workdir, options, true);
}

StageResult ProcessExecutor::execute(const std::string &stage_name,
                                     const std::string &executable,
                                     const std::vector<std::string> &args,
                                     const std::string &workdir,
                                     const ExecutionOptions &options,
                                     bool monitored) const
{
    StageResult result;
    result.stage_name = stage_name;
    result.executable = executable;
    result.command_line = formatCommandLine(executable, args);
    result.memory_before = ResourceMonitor::takeSnapshot();
    result.min_system_available_bytes = result.memory_before.system_available_bytes;

    auto finish = [&result](std::chrono::steady_clock::time_point started)
    {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        result.memory_after = ResourceMonitor::takeSnapshot();
        if (result.memory_after.system_total_bytes > 0)
        {
            result.min_system_available_bytes = std::min(result.min_system_available_bytes,
                                                         result.memory_after.system_available_bytes);
        }
    };

    const auto started = std::chrono::steady_clock::now();

    auto resolved = resolveExecutable(executable);
    if (!resolved)
    {
        result.launch_status = LaunchStatus::EXECUTABLE_NOT_FOUND;
        result.output = "executable not found on PATH: " + executable;
        finish(started);
        Logger::debug("ProcessExecutor: [" + stage_name + "] " + result.output);
        return result;
    }

    Poco::Pipe in_pipe;
    Poco::Pipe out_pipe;
    std::optional<Poco::ProcessHandle> handle;
    try
    {
        // stdout and stderr share one pipe so the captured text keeps its ordering
        handle.emplace(Poco::Process::launch(*resolved, args, workdir, &in_pipe, &out_pipe, &out_pipe));
    }
    catch (const Poco::Exception &e)
    {
        result.launch_status = LaunchStatus::LAUNCH_FAILED;
        result.output = "failed to launch " + *resolved + ": " + e.displayText();
        finish(started);
        Logger::warn("ProcessExecutor: [" + stage_name + "] " + result.output);
        return result;
    }

    // The child reads nothing from stdin
    in_pipe.close(Poco::Pipe::CLOSE_WRITE);

    const pid_t pid = static_cast<pid_t>(handle->id());

    // Succeeds while the child has not exec'd yet, which is the usual case;
    // otherwise the child stays in our group and only its tree is killed.
    const bool own_group = ::setpgid(pid, pid) == 0;
    Logger::debug("ProcessExecutor: [" + stage_name + "] started pid " + std::to_string(pid) +
                  (own_group ? "" : " (shared process group)") + ": " + result.command_line);

    auto capture = std::make_shared<OutputCapture>(out_pipe);
    std::thread reader([capture]()
                       { drainPipe(capture); });

    const auto interval = options.sample_interval.count() > 0 ? options.sample_interval : std::chrono::milliseconds(100);
    const bool polling = monitored || options.timeout.has_value() || options.cancel_token != nullptr;
    const std::optional<std::string> own_executable = monitored ? ResourceMonitor::executablePath(::getpid()) : std::nullopt;
    std::string wait_error;

    try
    {
        if (!polling)
        {
            result.exit_code = handle->wait();
        }
        else
        {
            for (;;)
            {
                int code = handle->tryWait();
                if (code != -1)
                {
                    result.exit_code = code;
                    break;
                }

                if (monitored)
                {
                    // Until exec the child is a copy of this process
                    auto child_executable = ResourceMonitor::executablePath(pid);
                    bool exec_done = child_executable && (!own_executable || *child_executable != *own_executable);
                    if (exec_done)
                    {
                        if (auto sample = ResourceMonitor::sampleProcess(pid))
                        {
                            uint64_t tree_rss = sample->rss_bytes;
                            for (pid_t descendant : ResourceMonitor::listDescendants(pid))
                            {
                                if (auto extra = ResourceMonitor::sampleProcess(descendant))
                                {
                                    tree_rss += extra->rss_bytes;
                                }
                            }
                            result.peak_rss_bytes = std::max({result.peak_rss_bytes, tree_rss, sample->peak_rss_bytes});
                            result.sample_count++;
                        }
                    }
                    SystemMemory system = ResourceMonitor::sampleSystem();
                    if (system.total_bytes > 0)
                    {
                        result.min_system_available_bytes = std::min(result.min_system_available_bytes, system.available_bytes);
                    }
                }

                if (options.cancel_token && options.cancel_token->isCancelled())
                {
                    result.cancelled = true;
                    result.exit_code = killTreeAndReap(*handle, own_group);
                    break;
                }

                auto elapsed = std::chrono::steady_clock::now() - started;
                if (options.timeout && elapsed >= *options.timeout)
                {
                    result.timed_out = true;
                    result.exit_code = killTreeAndReap(*handle, own_group);
                    break;
                }

                auto nap = interval;
                if (options.timeout)
                {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*options.timeout - elapsed);
                    nap = std::max(std::chrono::milliseconds(1), std::min(nap, remaining));
                }
                std::this_thread::sleep_for(nap);
            }
        }
    }
    catch (const Poco::Exception &e)
    {
        // Waiting failed; make sure the child does not outlive us
        Logger::error("ProcessExecutor: [" + stage_name + "] wait failed: " + e.displayText());
        if (own_group)
        {
            killGroup(pid);
        }
        try
        {
            Poco::Process::kill(*handle);
        }
        catch (const Poco::Exception &kill_error)
        {
            Logger::warn("ProcessExecutor: [" + stage_name + "] kill after failed wait: " + kill_error.displayText());
        }
        result.exit_code = -1;
        wait_error = "\n[wait failed: " + e.displayText() + "]";
    }

    // The child is gone. Anything still holding the output pipe was started by
    // it and is not waited for.
    bool drained = waitForDrain(capture, options.output_drain_timeout);
    if (!drained && own_group)
    {
        Logger::warn("ProcessExecutor: [" + stage_name + "] output still open after pid " + std::to_string(pid) +
                     " exited, killing its process group");
        killGroup(pid);
        drained = waitForDrain(capture, options.output_drain_timeout);
    }
    if (drained)
    {
        reader.join();
    }
    else
    {
        Logger::warn("ProcessExecutor: [" + stage_name + "] abandoning output of pid " + std::to_string(pid) +
                     ", the pipe is held by a process outside its group");
        reader.detach();
    }

    {
        std::lock_guard<std::mutex> lock(capture->mutex);
        result.output = capture->text;
    }
    if (!drained)
    {
        result.output += "\n[output truncated: pipe held open by a detached process]";
    }
    result.output += wait_error;
    finish(started);

    Logger::debug("ProcessExecutor: [" + stage_name + "] pid " + std::to_string(pid) + " exited with code " +
                  std::to_string(result.exit_code) + " after " + std::to_string(result.duration.count()) + "ms" +
                  (monitored ? ", peak rss " + ResourceMonitor::formatBytes(result.peak_rss_bytes) : std::string()));
    return result;
}
