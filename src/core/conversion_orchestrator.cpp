#include "core/conversion_orchestrator.hpp"
#include "core/converter_config.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace
{
    std::string formatRatio(double ratio)
    {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
        return ss.str();
    }
}

const char *conversionStateToString(ConversionState state)
{
    switch (state)
    {
    case ConversionState::START:
        return "start";
    case ConversionState::STAGED:
        return "staged";
    case ConversionState::RUNNING_STAGE:
        return "running_stage";
    case ConversionState::FAILED:
        return "failed";
    case ConversionState::COMPLETED:
        return "completed";
    }
    return "unknown";
}

uint64_t ConversionMetrics::peakStageMemory() const
{
    uint64_t peak = 0;
    for (const auto &stage : stages)
    {
        peak = std::max(peak, stage.peak_rss_bytes);
    }
    return peak;
}

OrchestratorSettings OrchestratorSettings::fromConfig(const ConverterConfig &config)
{
    OrchestratorSettings settings;
    settings.scratch_root = config.getScratchRoot();

    auto strategy = parseHeicDecodeStrategy(config.getHeicDecoder());
    if (strategy)
    {
        settings.heic_strategy = *strategy;
    }
    else
    {
        Logger::warn("OrchestratorSettings: unknown heic_decoder '" + config.getHeicDecoder() + "', using libheif");
    }

    settings.sample_interval = std::chrono::milliseconds(std::max(1, config.getSampleIntervalMs()));
    settings.low_memory_threshold_bytes = static_cast<uint64_t>(std::max(0, config.getLowMemoryThresholdMb())) * 1024 * 1024;
    settings.stderr_excerpt_bytes = static_cast<size_t>(std::max(64, config.getStderrExcerptBytes()));
    settings.tool_probe_timeout = std::chrono::seconds(std::max(1, config.getToolProbeTimeoutSeconds()));
    return settings;
}

ConversionOrchestrator::ConversionOrchestrator(OrchestratorSettings settings)
    : settings_(std::move(settings)),
      planner_(settings_.heic_strategy),
      staging_(settings_.scratch_root),
      classifier_(settings_.stderr_excerpt_bytes)
{
}

ConversionOutcome ConversionOrchestrator::convert(std::vector<uint8_t> data, const std::string &format_tag, const std::string &filename) const
{
    return convert(ConversionRequest(std::move(data), format_tag, filename));
}

ConversionOutcome ConversionOrchestrator::convert(ConversionRequest request, const CancellationToken *cancel_token) const
{
    const std::string display_name = FileUtils::sanitizeFilename(request.filename);

    // Validation happens before any filesystem or process work
    auto plan = planner_.plan(request.format_tag);
    if (!plan)
    {
        auto outcome = ConversionOutcome::failure(classifier_.unsupportedFormat(request.format_tag), ConversionState::START);
        outcome.metrics.input_size = request.data.size();
        Logger::warn("ConversionOrchestrator: rejected " + display_name + ": " + outcome.error->describe());
        return outcome;
    }

    Logger::info("ConversionOrchestrator: converting " + display_name + " (" + inputFormatToString(plan->format) +
                 ", " + ResourceMonitor::formatBytes(request.data.size()) + ", " +
                 std::to_string(plan->stages.size()) + " stage(s))");

    const auto started = std::chrono::steady_clock::now();
    ConversionOutcome outcome = runPipeline(request, *plan, cancel_token);
    outcome.metrics.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.success)
    {
        Logger::info("ConversionOrchestrator: converted " + display_name + ": " +
                     ResourceMonitor::formatBytes(outcome.metrics.input_size) + " -> " +
                     ResourceMonitor::formatBytes(outcome.metrics.output_size) + " (saved " +
                     formatRatio(outcome.metrics.compression_ratio) + ") in " +
                     std::to_string(outcome.metrics.total_duration.count()) + "ms, peak stage memory " +
                     ResourceMonitor::formatBytes(outcome.metrics.peakStageMemory()));
    }
    else
    {
        Logger::error("ConversionOrchestrator: conversion of " + display_name + " failed: " + outcome.error->describe());
    }
    return outcome;
}

ConversionOutcome ConversionOrchestrator::runPipeline(ConversionRequest &request, const PipelinePlan &plan,
                                                      const CancellationToken *cancel_token) const
{
    ConversionMetrics metrics;
    metrics.input_size = request.data.size();
    metrics.memory_start = ResourceMonitor::takeSnapshot();
    noteMemory(metrics, metrics.memory_start, "start");

    std::string scratch_error;
    auto area = staging_.acquire(scratch_error);
    if (!area)
    {
        auto outcome = ConversionOutcome::failure(classifier_.scratchUnavailable(scratch_error), ConversionState::FAILED);
        metrics.memory_end = ResourceMonitor::takeSnapshot();
        outcome.metrics = std::move(metrics);
        return outcome;
    }

    std::string current_stage;
    auto transition = [&area](ConversionState state, const std::string &detail)
    {
        Logger::trace("ConversionOrchestrator: " + area->getPath() + " -> " + conversionStateToString(state) +
                      (detail.empty() ? std::string() : " (" + detail + ")"));
    };

    // Every failure path releases the scratch area before the outcome is returned
    auto fail = [&](ConversionError error)
    {
        transition(ConversionState::FAILED, current_stage);
        ConversionOutcome outcome = ConversionOutcome::failure(std::move(error), ConversionState::FAILED);
        outcome.scratch_path = area->getPath();
        area->release();
        metrics.memory_end = ResourceMonitor::takeSnapshot();
        noteMemory(metrics, metrics.memory_end, "end");
        outcome.metrics = std::move(metrics);
        return outcome;
    };

    try
    {
        std::string write_error;
        if (!area->writeArtifact(plan.artifactName(ArtifactRole::SOURCE), request.data, write_error))
        {
            return fail(classifier_.ioFailure("", "staging input failed: " + write_error));
        }

        // The bytes live on disk now; don't hold them twice
        std::vector<uint8_t>().swap(request.data);
        transition(ConversionState::STAGED, plan.artifactName(ArtifactRole::SOURCE));

        ExecutionOptions options;
        options.sample_interval = settings_.sample_interval;
        options.cancel_token = cancel_token;

        for (const auto &stage : plan.stages)
        {
            current_stage = stage.name;

            if (cancel_token && cancel_token->isCancelled())
            {
                StageResult skipped;
                skipped.stage_name = stage.name;
                skipped.executable = stage.executable;
                skipped.cancelled = true;
                skipped.exit_code = -1;
                return fail(classifier_.classifyStage(skipped));
            }

            const std::string input_name = plan.artifactName(stage.input_role);
            const std::string output_name = plan.artifactName(stage.output_role);
            auto args = stage.resolveArguments(area->pathFor(input_name), area->pathFor(output_name));
            transition(ConversionState::RUNNING_STAGE, stage.name);

            StageResult result = executor_.runMonitored(stage.name, stage.executable, args, area->getPath(), options);

            // The sampled minimum includes the snapshots taken around the stage
            if (result.min_system_available_bytes > 0 &&
                result.min_system_available_bytes < settings_.low_memory_threshold_bytes)
            {
                metrics.low_memory_warning = true;
                metrics.warnings.push_back("low system memory during " + stage.name + ": " +
                                           ResourceMonitor::formatBytes(result.min_system_available_bytes) + " available");
                Logger::warn("ConversionOrchestrator: low system memory during " + stage.name + ": " +
                             ResourceMonitor::formatBytes(result.min_system_available_bytes) + " available");
            }

            if (!result.succeeded())
            {
                ConversionError error = classifier_.classifyStage(result);
                result.output = classifier_.excerpt(result.output);
                metrics.stages.push_back(std::move(result));
                return fail(std::move(error));
            }

            auto produced = FileUtils::getFileSize(area->pathFor(output_name));
            if (!produced || *produced == 0)
            {
                ConversionError error = classifier_.missingArtifact(result, output_name);
                result.output = classifier_.excerpt(result.output);
                metrics.stages.push_back(std::move(result));
                return fail(std::move(error));
            }

            Logger::debug("ConversionOrchestrator: stage " + stage.name + " produced " + output_name + " (" +
                          ResourceMonitor::formatBytes(*produced) + ") in " + std::to_string(result.duration.count()) + "ms");

            result.output = classifier_.excerpt(result.output);
            metrics.stages.push_back(std::move(result));
        }

        current_stage.clear();
        std::string read_error;
        auto output = area->readArtifact(plan.artifactName(ArtifactRole::OUTPUT), read_error);
        if (!output)
        {
            return fail(classifier_.ioFailure(plan.stages.back().name, "reading output failed: " + read_error));
        }

        transition(ConversionState::COMPLETED, "");
        ConversionOutcome outcome;
        outcome.success = true;
        outcome.final_state = ConversionState::COMPLETED;
        outcome.scratch_path = area->getPath();
        outcome.output = std::move(*output);

        metrics.output_size = outcome.output.size();
        metrics.compression_ratio = metrics.input_size > 0
                                        ? 1.0 - static_cast<double>(metrics.output_size) / static_cast<double>(metrics.input_size)
                                        : 0.0;

        area->release();
        metrics.memory_end = ResourceMonitor::takeSnapshot();
        noteMemory(metrics, metrics.memory_end, "end");
        outcome.metrics = std::move(metrics);
        return outcome;
    }
    catch (const std::exception &e)
    {
        return fail(classifier_.unexpectedFault(current_stage, e));
    }
}

void ConversionOrchestrator::noteMemory(ConversionMetrics &metrics, const MemorySnapshot &snapshot, const std::string &when) const
{
    if (!snapshot.isLowMemory(settings_.low_memory_threshold_bytes))
    {
        return;
    }
    metrics.low_memory_warning = true;
    metrics.warnings.push_back("low system memory at " + when + ": " +
                               ResourceMonitor::formatBytes(snapshot.system_available_bytes) + " available");
    Logger::warn("ConversionOrchestrator: low system memory at " + when + ": " + snapshot.toString());
}

bool ConversionOrchestrator::toolAvailable(const std::string &tool_name) const
{
    ExecutionOptions options;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.tool_probe_timeout);
    options.sample_interval = std::chrono::milliseconds(50);

    // Empty working directory: inherit ours
    StageResult result = executor_.run("probe", tool_name, PipelinePlanner::versionArguments(tool_name), "", options);
    bool available = result.succeeded();
    if (!available)
    {
        Logger::debug("ConversionOrchestrator: tool " + tool_name + " unavailable (" +
                      launchStatusToString(result.launch_status) + ", exit " + std::to_string(result.exit_code) +
                      (result.timed_out ? ", timed out" : "") + ")");
    }
    return available;
}

std::vector<std::string> ConversionOrchestrator::requiredTools() const
{
    std::vector<std::string> tools;
    tools.push_back(PipelinePlanner::encodeStage(ArtifactRole::SOURCE).executable);
    tools.push_back(PipelinePlanner::decodeStage(settings_.heic_strategy).executable);
    return tools;
}
