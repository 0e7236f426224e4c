#include "core/outcome_serializer.hpp"
#include "core/pipeline_planner.hpp"
#include <Poco/Base64Encoder.h>
#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace
{
    double round2(double value)
    {
        return std::round(value * 100.0) / 100.0;
    }
}

double OutcomeSerializer::toMegabytes(uint64_t bytes)
{
    return round2(static_cast<double>(bytes) / (1024.0 * 1024.0));
}

json OutcomeSerializer::memoryToJson(const MemorySnapshot &snapshot)
{
    double percent = 0.0;
    if (snapshot.system_total_bytes > 0)
    {
        percent = static_cast<double>(snapshot.rss_bytes) * 100.0 / static_cast<double>(snapshot.system_total_bytes);
    }

    json result = {
        {"rss_mb", toMegabytes(snapshot.rss_bytes)},
        {"vms_mb", toMegabytes(snapshot.vms_bytes)},
        {"percent", round2(percent)},
        {"system_available_mb", toMegabytes(snapshot.system_available_bytes)},
        {"system_percent_used", round2(snapshot.system_percent_used)}};

    if (snapshot.cgroup_limit_bytes)
    {
        result["cgroup_limit_mb"] = toMegabytes(*snapshot.cgroup_limit_bytes);
    }
    if (snapshot.soft_limit_bytes)
    {
        result["address_space_limit_mb"] = toMegabytes(*snapshot.soft_limit_bytes);
    }
    return result;
}

json OutcomeSerializer::stageToJson(const StageResult &stage)
{
    return json{
        {"name", stage.stage_name},
        {"command", stage.command_line},
        {"exitCode", stage.exit_code},
        {"durationSec", round2(stage.duration.count() / 1000.0)},
        {"peakMemoryMB", toMegabytes(stage.peak_rss_bytes)},
        {"samples", stage.sample_count},
        {"timedOut", stage.timed_out},
        {"cancelled", stage.cancelled}};
}

json OutcomeSerializer::metricsToJson(const ConversionMetrics &metrics)
{
    json stages = json::array();
    for (const auto &stage : metrics.stages)
    {
        stages.push_back(stageToJson(stage));
    }

    return json{
        {"memoryBeforeMB", memoryToJson(metrics.memory_start)},
        {"memoryAfterMB", memoryToJson(metrics.memory_end)},
        {"peakMemoryMB", toMegabytes(metrics.peakStageMemory())},
        {"conversionTimeSec", round2(metrics.total_duration.count() / 1000.0)},
        {"inputSize", metrics.input_size},
        {"outputSize", metrics.output_size},
        {"compressionRatio", round2(metrics.compression_ratio)},
        {"lowMemory", metrics.low_memory_warning},
        {"warnings", metrics.warnings},
        {"stages", stages}};
}

json OutcomeSerializer::errorToJson(const ConversionError &error)
{
    json result = {
        {"kind", conversionErrorKindToString(error.kind)},
        {"message", error.message}};
    if (!error.stage_name.empty())
    {
        result["stage"] = error.stage_name;
    }
    if (error.exit_code)
    {
        result["exitCode"] = *error.exit_code;
    }
    return result;
}

json OutcomeSerializer::toJson(const ConversionOutcome &outcome, const std::string &filename)
{
    json result = {
        {"success", outcome.success},
        {"metrics", metricsToJson(outcome.metrics)}};

    if (outcome.success)
    {
        result["data"] = {
            {"fullSize",
             {{"filename", filename},
              {"content", encodeBase64(outcome.output)},
              {"size", outcome.output.size()},
              {"mimetype", "image/avif"},
              {"variant", "full"}}}};
    }
    else if (outcome.error)
    {
        result["error"] = errorToJson(*outcome.error);
    }
    return result;
}

json OutcomeSerializer::healthToJson(const std::map<std::string, bool> &tools, const MemorySnapshot &snapshot)
{
    const std::string encoder = PipelinePlanner::encodeStage(ArtifactRole::SOURCE).executable;
    auto it = tools.find(encoder);
    bool healthy = it != tools.end() && it->second;

    json capabilities = json::object();
    for (const auto &[tool, available] : tools)
    {
        capabilities[tool] = available;
    }

    return json{
        {"status", healthy ? "healthy" : "unhealthy"},
        {"service", "avif-converter"},
        {"memory", memoryToJson(snapshot)},
        {"capabilities", capabilities}};
}

std::string OutcomeSerializer::encodeBase64(const std::vector<uint8_t> &data)
{
    std::ostringstream out;
    Poco::Base64Encoder encoder(out);
    encoder.rdbuf()->setLineLength(0);
    encoder.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    encoder.close();
    return out.str();
}
