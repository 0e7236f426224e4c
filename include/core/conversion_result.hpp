#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/conversion_error.hpp"
#include "core/process_executor.hpp"
#include "core/resource_monitor.hpp"

/**
 * @brief One upload handed to the orchestrator
 */
struct ConversionRequest
{
    std::vector<uint8_t> data;
    std::string format_tag; // "jpeg" or "heic"
    std::string filename;   // display only, never used for paths

    ConversionRequest() = default;
    ConversionRequest(std::vector<uint8_t> d, std::string tag, std::string name)
        : data(std::move(d)), format_tag(std::move(tag)), filename(std::move(name)) {}
};

/**
 * @brief States a request moves through
 */
enum class ConversionState
{
    START,
    STAGED,
    RUNNING_STAGE,
    FAILED,
    COMPLETED
};

const char *conversionStateToString(ConversionState state);

/**
 * @brief Telemetry gathered while converting
 */
struct ConversionMetrics
{
    uint64_t input_size = 0;
    uint64_t output_size = 0;
    double compression_ratio = 0.0; // 1 - output/input
    std::chrono::milliseconds total_duration{0};

    std::vector<StageResult> stages;
    MemorySnapshot memory_start;
    MemorySnapshot memory_end;

    bool low_memory_warning = false;
    std::vector<std::string> warnings;

    /**
     * @brief Largest child resident size seen across all stages
     */
    uint64_t peakStageMemory() const;
};

/**
 * @brief Result of Convert: output bytes and metrics, or a classified error
 */
struct ConversionOutcome
{
    bool success = false;
    std::vector<uint8_t> output;
    std::optional<ConversionError> error;
    ConversionMetrics metrics;

    ConversionState final_state = ConversionState::START;
    std::string scratch_path; // empty if no scratch area was acquired

    static ConversionOutcome failure(ConversionError error, ConversionState state)
    {
        ConversionOutcome outcome;
        outcome.success = false;
        outcome.error = std::move(error);
        outcome.final_state = state;
        return outcome;
    }
};
