#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/resource_monitor.hpp"

/**
 * @brief How far an external command got before it finished
 */
enum class LaunchStatus
{
    LAUNCHED,             // Process ran; see exit_code
    EXECUTABLE_NOT_FOUND, // Not on PATH or not executable
    LAUNCH_FAILED         // Found but the process could not be spawned
};

const char *launchStatusToString(LaunchStatus status);

/**
 * @brief Knobs for a single execution
 */
struct ExecutionOptions
{
    std::chrono::milliseconds sample_interval{100};

    // External policy; no timeout when empty
    std::optional<std::chrono::milliseconds> timeout;

    // Not owned; may be null
    const CancellationToken *cancel_token = nullptr;

    // How long to wait for the output pipe to close once the child is gone
    std::chrono::milliseconds output_drain_timeout{1000};
};

/**
 * @brief Result of running one external command
 */
struct StageResult
{
    std::string stage_name;
    std::string executable;
    std::string command_line;
    LaunchStatus launch_status = LaunchStatus::LAUNCHED;
    int exit_code = -1;
    std::string output; // stdout and stderr, interleaved
    std::chrono::milliseconds duration{0};

    // Filled by monitored runs only
    uint64_t peak_rss_bytes = 0;
    size_t sample_count = 0;
    uint64_t min_system_available_bytes = 0;

    bool timed_out = false;
    bool cancelled = false;

    MemorySnapshot memory_before;
    MemorySnapshot memory_after;

    bool succeeded() const
    {
        return launch_status == LaunchStatus::LAUNCHED && exit_code == 0 && !timed_out && !cancelled;
    }
};

/**
 * @brief Runs external codec tools as child processes
 *
 * The executor is stateless and may be shared between threads. Failures of the
 * child are reported through StageResult, never thrown.
 *
 * Each child is moved into a process group of its own. A timeout or a
 * cancellation kills that group and any descendant still attached to the child.
 */
class ProcessExecutor
{
public:
    /**
     * @brief Resolve an executable name against PATH
     * @param name Bare tool name, or a path containing '/'
     * @return Absolute path of an executable file, or empty if none was found
     */
    static std::optional<std::string> resolveExecutable(const std::string &name);

    /**
     * @brief Run a command and block until it exits (or times out / is cancelled)
     * @param stage_name Logical name recorded in the result
     * @param executable Tool name resolved against PATH
     * @param args Arguments, without argv[0]
     * @param workdir Working directory of the child
     */
    StageResult run(const std::string &stage_name,
                    const std::string &executable,
                    const std::vector<std::string> &args,
                    const std::string &workdir,
                    const ExecutionOptions &options = ExecutionOptions{}) const;

    /**
     * @brief Like run(), and samples the child's memory every sample_interval
     *
     * The peak resident size observed (including the kernel's high-water mark) is
     * recorded in StageResult::peak_rss_bytes. Resident sizes of the child's
     * descendants are added in. Samples taken before the child has exec'd the
     * tool are skipped, since they describe a copy of this process.
     */
    StageResult runMonitored(const std::string &stage_name,
                             const std::string &executable,
                             const std::vector<std::string> &args,
                             const std::string &workdir,
                             const ExecutionOptions &options = ExecutionOptions{}) const;

    static std::string formatCommandLine(const std::string &executable, const std::vector<std::string> &args);

private:
    StageResult execute(const std::string &stage_name,
                        const std::string &executable,
                        const std::vector<std::string> &args,
                        const std::string &workdir,
                        const ExecutionOptions &options,
                        bool monitored) const;
};
