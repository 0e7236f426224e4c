#pragma once

#include <optional>
#include <string>
#include "core/process_executor.hpp"

/**
 * @brief Closed set of failure kinds a conversion can end in
 */
enum class ConversionErrorKind
{
    INPUT_ERROR,       // caller's fault: unsupported or missing format
    ENVIRONMENT_ERROR, // host misconfiguration: tool missing, scratch area unavailable
    STAGE_FAILURE,     // a pipeline stage ran and failed
    IO_ERROR           // reading or writing an artifact failed
};

const char *conversionErrorKindToString(ConversionErrorKind kind);

/**
 * @brief Classified failure with enough context for the logs
 */
struct ConversionError
{
    ConversionErrorKind kind = ConversionErrorKind::STAGE_FAILURE;
    std::string message;
    std::string stage_name;       // empty when no stage was involved
    std::optional<int> exit_code; // set for stages that ran
    std::string stderr_excerpt;

    bool isClientError() const { return kind == ConversionErrorKind::INPUT_ERROR; }

    /**
     * @brief One-line description with stage, exit code and excerpt
     */
    std::string describe() const;
};

/**
 * @brief Turns raw failure material into a ConversionError
 *
 * Never reports success: anything it cannot attribute precisely becomes a
 * STAGE_FAILURE carrying whatever diagnostic text is available.
 */
class ErrorClassifier
{
public:
    static constexpr size_t DEFAULT_EXCERPT_BYTES = 2048;

    explicit ErrorClassifier(size_t excerpt_bytes = DEFAULT_EXCERPT_BYTES);

    ConversionError unsupportedFormat(const std::string &format_tag) const;

    ConversionError scratchUnavailable(const std::string &detail) const;

    ConversionError ioFailure(const std::string &stage_name, const std::string &detail) const;

    /**
     * @brief Classify a stage that did not succeed
     */
    ConversionError classifyStage(const StageResult &result) const;

    /**
     * @brief A stage exited 0 but its output artifact is missing
     */
    ConversionError missingArtifact(const StageResult &result, const std::string &artifact_name) const;

    /**
     * @brief Classify an exception that escaped the pipeline
     */
    ConversionError unexpectedFault(const std::string &stage_name, const std::exception &e) const;

    /**
     * @brief Tail of a tool's output, bounded to the excerpt size
     *
     * Tools print the decisive message last, so the tail is kept.
     */
    std::string excerpt(const std::string &output) const;

private:
    size_t excerpt_bytes_;
};
