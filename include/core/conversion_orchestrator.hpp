#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/conversion_error.hpp"
#include "core/conversion_result.hpp"
#include "core/pipeline_planner.hpp"
#include "core/process_executor.hpp"
#include "core/scratch_area.hpp"

class ConverterConfig;

/**
 * @brief Tunables of the conversion pipeline
 */
struct OrchestratorSettings
{
    std::string scratch_root; // system temp directory when empty
    HeicDecodeStrategy heic_strategy = HeicDecodeStrategy::LIBHEIF;
    std::chrono::milliseconds sample_interval{100};
    uint64_t low_memory_threshold_bytes = ResourceMonitor::DEFAULT_LOW_MEMORY_THRESHOLD_BYTES;
    size_t stderr_excerpt_bytes = ErrorClassifier::DEFAULT_EXCERPT_BYTES;
    std::chrono::seconds tool_probe_timeout{5};

    static OrchestratorSettings fromConfig(const ConverterConfig &config);
};

/**
 * @brief Converts JPEG and HEIC uploads to AVIF through external codec tools
 *
 * Each call to convert() gets its own scratch area and runs its stages one
 * after another. The orchestrator keeps no per-request state, so one instance
 * can serve concurrent requests from several threads.
 */
class ConversionOrchestrator
{
public:
    explicit ConversionOrchestrator(OrchestratorSettings settings = OrchestratorSettings{});

    /**
     * @brief Convert an upload to AVIF
     * @param request Upload; its buffer is released as soon as it is staged on disk
     * @param cancel_token Optional; when cancelled the running stage is killed
     * @return Output and metrics, or a classified error. Never throws.
     */
    ConversionOutcome convert(ConversionRequest request, const CancellationToken *cancel_token = nullptr) const;

    ConversionOutcome convert(std::vector<uint8_t> data, const std::string &format_tag, const std::string &filename) const;

    /**
     * @brief Health probe: can the tool be launched and report its version?
     *
     * Bounded by tool_probe_timeout. Launch failure, timeout or non-zero exit
     * all yield false.
     */
    bool toolAvailable(const std::string &tool_name) const;

    /**
     * @brief Executables the current plan configuration depends on
     */
    std::vector<std::string> requiredTools() const;

private:
    ConversionOutcome runPipeline(ConversionRequest &request, const PipelinePlan &plan,
                                  const CancellationToken *cancel_token) const;

    void noteMemory(ConversionMetrics &metrics, const MemorySnapshot &snapshot, const std::string &when) const;

    OrchestratorSettings settings_;
    PipelinePlanner planner_;
    StagingAreaManager staging_;
    ProcessExecutor executor_;
    ErrorClassifier classifier_;
};
