#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/**
 * @brief Memory figures of a single process, read from /proc/<pid>/status
 */
struct ProcessMemory
{
    uint64_t rss_bytes = 0;      // VmRSS
    uint64_t vms_bytes = 0;      // VmSize
    uint64_t peak_rss_bytes = 0; // VmHWM, high-water mark of the resident set
};

/**
 * @brief Host memory figures, read from /proc/meminfo
 */
struct SystemMemory
{
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
    double percent_used = 0.0;
};

/**
 * @brief Immutable point-in-time view of process and host memory
 */
struct MemorySnapshot
{
    uint64_t rss_bytes = 0;
    uint64_t vms_bytes = 0;
    uint64_t system_total_bytes = 0;
    uint64_t system_available_bytes = 0;
    double system_percent_used = 0.0;

    // Address-space ceiling from getrlimit(RLIMIT_AS); empty when unlimited
    std::optional<uint64_t> soft_limit_bytes;
    std::optional<uint64_t> hard_limit_bytes;

    // Container memory limit from the cgroup hierarchy; empty when unlimited
    std::optional<uint64_t> cgroup_limit_bytes;

    std::chrono::system_clock::time_point taken_at{};

    bool isLowMemory(uint64_t threshold_bytes) const
    {
        return system_total_bytes > 0 && system_available_bytes < threshold_bytes;
    }

    std::string toString() const;
};

/**
 * @brief Side-effect-free memory sampling for the conversion pipeline
 *
 * All functions are pure observations of the host. They never throw; figures
 * that cannot be read are reported as zero or as an empty optional.
 */
class ResourceMonitor
{
public:
    /**
     * @brief Default threshold under which available system memory is reported as low
     */
    static constexpr uint64_t DEFAULT_LOW_MEMORY_THRESHOLD_BYTES = 100ull * 1024 * 1024;

    /**
     * @brief Take a snapshot of the current process and the host
     */
    static MemorySnapshot takeSnapshot();

    /**
     * @brief Sample the memory of another process
     * @param pid Process id
     * @return Empty if the process does not exist (or has already been reaped)
     */
    static std::optional<ProcessMemory> sampleProcess(pid_t pid);

    /**
     * @brief Sample the memory of the current process
     */
    static ProcessMemory sampleSelf();

    static SystemMemory sampleSystem();

    /**
     * @brief Target of /proc/<pid>/exe
     * @return Empty if the process is gone or the link cannot be read
     */
    static std::optional<std::string> executablePath(pid_t pid);

    /**
     * @brief Children of a process, their children, and so on
     *
     * Built from the parent pid field of every /proc/<pid>/stat. Processes
     * that were already reparented away from the tree are not found.
     */
    static std::vector<pid_t> listDescendants(pid_t pid);

    /**
     * @brief Container memory limit (cgroup v2 memory.max, then cgroup v1)
     */
    static std::optional<uint64_t> cgroupMemoryLimit();

    /**
     * @brief Format bytes to human-readable string, e.g. "1.50 MB"
     */
    static std::string formatBytes(uint64_t bytes);

private:
    static std::optional<ProcessMemory> readStatusFile(const std::string &path);
};
