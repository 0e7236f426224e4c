#include "core/resource_monitor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <sys/resource.h>
#include <unistd.h>

namespace
{
    // Parses "VmRSS:     1234 kB" style lines
    bool parseKbField(const std::string &line, const char *key, uint64_t &out)
    {
        const std::string prefix = std::string(key) + ":";
        if (line.compare(0, prefix.size(), prefix) != 0)
        {
            return false;
        }
        std::istringstream iss(line.substr(prefix.size()));
        uint64_t kb = 0;
        if (!(iss >> kb))
        {
            return false;
        }
        out = kb * 1024;
        return true;
    }

    std::optional<uint64_t> readLimitFile(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.good())
        {
            return std::nullopt;
        }
        std::string value;
        in >> value;
        if (value.empty() || value == "max")
        {
            return std::nullopt;
        }
        try
        {
            uint64_t limit = std::stoull(value);
            // cgroup v1 reports "unlimited" as a huge page-aligned number
            if (limit >= (1ull << 62))
            {
                return std::nullopt;
            }
            return limit;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }
}

std::string MemorySnapshot::toString() const
{
    std::stringstream ss;
    ss << "rss=" << ResourceMonitor::formatBytes(rss_bytes)
       << " vms=" << ResourceMonitor::formatBytes(vms_bytes)
       << " system_available=" << ResourceMonitor::formatBytes(system_available_bytes)
       << "/" << ResourceMonitor::formatBytes(system_total_bytes)
       << " (" << std::fixed << std::setprecision(1) << system_percent_used << "% used)";
    if (cgroup_limit_bytes)
    {
        ss << " cgroup_limit=" << ResourceMonitor::formatBytes(*cgroup_limit_bytes);
    }
    return ss.str();
}

MemorySnapshot ResourceMonitor::takeSnapshot()
{
    MemorySnapshot snapshot;
    snapshot.taken_at = std::chrono::system_clock::now();

    ProcessMemory self = sampleSelf();
    snapshot.rss_bytes = self.rss_bytes;
    snapshot.vms_bytes = self.vms_bytes;

    SystemMemory system = sampleSystem();
    snapshot.system_total_bytes = system.total_bytes;
    snapshot.system_available_bytes = system.available_bytes;
    snapshot.system_percent_used = system.percent_used;

    struct rlimit limit;
    if (getrlimit(RLIMIT_AS, &limit) == 0)
    {
        if (limit.rlim_cur != RLIM_INFINITY)
        {
            snapshot.soft_limit_bytes = static_cast<uint64_t>(limit.rlim_cur);
        }
        if (limit.rlim_max != RLIM_INFINITY)
        {
            snapshot.hard_limit_bytes = static_cast<uint64_t>(limit.rlim_max);
        }
    }

    snapshot.cgroup_limit_bytes = cgroupMemoryLimit();
    return snapshot;
}

std::optional<ProcessMemory> ResourceMonitor::sampleProcess(pid_t pid)
{
    if (pid <= 0)
    {
        return std::nullopt;
    }
    return readStatusFile("/proc/" + std::to_string(pid) + "/status");
}

ProcessMemory ResourceMonitor::sampleSelf()
{
    return readStatusFile("/proc/self/status").value_or(ProcessMemory{});
}

SystemMemory ResourceMonitor::sampleSystem()
{
    SystemMemory memory;
    std::ifstream in("/proc/meminfo");
    if (!in.good())
    {
        return memory;
    }

    uint64_t free_bytes = 0;
    bool have_available = false;
    std::string line;
    while (std::getline(in, line))
    {
        uint64_t value = 0;
        if (parseKbField(line, "MemTotal", value))
        {
            memory.total_bytes = value;
        }
        else if (parseKbField(line, "MemAvailable", value))
        {
            memory.available_bytes = value;
            have_available = true;
        }
        else if (parseKbField(line, "MemFree", value))
        {
            free_bytes = value;
        }
    }

    // Kernels before 3.14 have no MemAvailable
    if (!have_available)
    {
        memory.available_bytes = free_bytes;
    }

    if (memory.total_bytes > 0)
    {
        uint64_t used = memory.total_bytes > memory.available_bytes ? memory.total_bytes - memory.available_bytes : 0;
        memory.percent_used = 100.0 * static_cast<double>(used) / static_cast<double>(memory.total_bytes);
    }
    return memory;
}

std::optional<std::string> ResourceMonitor::executablePath(pid_t pid)
{
    std::error_code ec;
    auto target = std::filesystem::read_symlink("/proc/" + std::to_string(pid) + "/exe", ec);
    if (ec)
    {
        return std::nullopt;
    }
    return target.string();
}

std::vector<pid_t> ResourceMonitor::listDescendants(pid_t pid)
{
    std::multimap<pid_t, pid_t> children_of;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator("/proc", ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        const std::string name = it->path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c)
                                         { return std::isdigit(c) != 0; }))
        {
            continue;
        }

        std::ifstream in(it->path() / "stat");
        std::string line;
        if (!std::getline(in, line))
        {
            continue;
        }
        // "pid (comm) state ppid ..."; comm may itself contain ')'
        auto comm_end = line.rfind(')');
        if (comm_end == std::string::npos)
        {
            continue;
        }
        std::istringstream fields(line.substr(comm_end + 1));
        char state = 0;
        long parent = 0;
        if (!(fields >> state >> parent))
        {
            continue;
        }
        try
        {
            children_of.emplace(static_cast<pid_t>(parent), static_cast<pid_t>(std::stol(name)));
        }
        catch (const std::exception &)
        {
            continue;
        }
    }

    std::vector<pid_t> descendants;
    std::vector<pid_t> pending = {pid};
    while (!pending.empty())
    {
        pid_t current = pending.back();
        pending.pop_back();
        auto range = children_of.equal_range(current);
        for (auto child = range.first; child != range.second; ++child)
        {
            descendants.push_back(child->second);
            pending.push_back(child->second);
        }
    }
    return descendants;
}

std::optional<uint64_t> ResourceMonitor::cgroupMemoryLimit()
{
    if (auto limit = readLimitFile("/sys/fs/cgroup/memory.max"))
    {
        return limit;
    }
    return readLimitFile("/sys/fs/cgroup/memory/memory.limit_in_bytes");
}

std::string ResourceMonitor::formatBytes(uint64_t bytes)
{
    const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4)
    {
        size /= 1024.0;
        unit_index++;
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return ss.str();
}

std::optional<ProcessMemory> ResourceMonitor::readStatusFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        return std::nullopt;
    }

    ProcessMemory memory;
    std::string line;
    while (std::getline(in, line))
    {
        uint64_t value = 0;
        if (parseKbField(line, "VmRSS", value))
        {
            memory.rss_bytes = value;
        }
        else if (parseKbField(line, "VmSize", value))
        {
            memory.vms_bytes = value;
        }
        else if (parseKbField(line, "VmHWM", value))
        {
            memory.peak_rss_bytes = value;
        }
    }
    return memory;
}
