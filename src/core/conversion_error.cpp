#include "core/conversion_error.hpp"
#include <filesystem>

namespace
{
    std::string describeExit(int exit_code)
    {
        // Poco reports signal deaths as 256 + signal number
        if (exit_code > 255)
        {
            return "terminated by signal " + std::to_string(exit_code - 256);
        }
        return "exited with code " + std::to_string(exit_code);
    }

    std::string trimWhitespace(const std::string &text)
    {
        auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return "";
        }
        auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }
}

const char *conversionErrorKindToString(ConversionErrorKind kind)
{
    switch (kind)
    {
    case ConversionErrorKind::INPUT_ERROR:
        return "input_error";
    case ConversionErrorKind::ENVIRONMENT_ERROR:
        return "environment_error";
    case ConversionErrorKind::STAGE_FAILURE:
        return "stage_failure";
    case ConversionErrorKind::IO_ERROR:
        return "io_error";
    }
    return "unknown";
}

std::string ConversionError::describe() const
{
    std::string text = std::string(conversionErrorKindToString(kind)) + ": " + message;
    if (!stage_name.empty())
    {
        text += " [stage=" + stage_name;
        if (exit_code)
        {
            text += ", exit=" + std::to_string(*exit_code);
        }
        text += "]";
    }
    if (!stderr_excerpt.empty())
    {
        text += " stderr: " + stderr_excerpt;
    }
    return text;
}

ErrorClassifier::ErrorClassifier(size_t excerpt_bytes) : excerpt_bytes_(excerpt_bytes)
{
}

ConversionError ErrorClassifier::unsupportedFormat(const std::string &format_tag) const
{
    ConversionError error;
    error.kind = ConversionErrorKind::INPUT_ERROR;
    error.message = format_tag.empty()
                        ? "missing input format; expected jpeg or heic"
                        : "unsupported input format '" + excerpt(format_tag) + "'; expected jpeg or heic";
    return error;
}

ConversionError ErrorClassifier::scratchUnavailable(const std::string &detail) const
{
    ConversionError error;
    error.kind = ConversionErrorKind::ENVIRONMENT_ERROR;
    error.message = "scratch area unavailable: " + detail;
    return error;
}

ConversionError ErrorClassifier::ioFailure(const std::string &stage_name, const std::string &detail) const
{
    ConversionError error;
    error.kind = ConversionErrorKind::IO_ERROR;
    error.stage_name = stage_name;
    error.message = detail;
    return error;
}

ConversionError ErrorClassifier::classifyStage(const StageResult &result) const
{
    ConversionError error;
    error.stage_name = result.stage_name;
    error.stderr_excerpt = excerpt(result.output);

    switch (result.launch_status)
    {
    case LaunchStatus::EXECUTABLE_NOT_FOUND:
        error.kind = ConversionErrorKind::ENVIRONMENT_ERROR;
        error.message = "required tool is not installed: " + result.executable;
        return error;
    case LaunchStatus::LAUNCH_FAILED:
        error.kind = ConversionErrorKind::ENVIRONMENT_ERROR;
        error.message = "required tool could not be started: " + result.executable;
        return error;
    case LaunchStatus::LAUNCHED:
        break;
    }

    error.kind = ConversionErrorKind::STAGE_FAILURE;
    error.exit_code = result.exit_code;

    if (result.cancelled)
    {
        error.message = "stage cancelled by caller";
    }
    else if (result.timed_out)
    {
        error.message = "stage timed out after " + std::to_string(result.duration.count()) + "ms";
    }
    else if (result.exit_code != 0)
    {
        error.message = "stage " + describeExit(result.exit_code);
    }
    else
    {
        error.message = "stage reported success but was classified as failed";
    }
    return error;
}

ConversionError ErrorClassifier::missingArtifact(const StageResult &result, const std::string &artifact_name) const
{
    ConversionError error;
    error.kind = ConversionErrorKind::STAGE_FAILURE;
    error.stage_name = result.stage_name;
    error.exit_code = result.exit_code;
    error.stderr_excerpt = excerpt(result.output);
    error.message = "stage exited successfully but did not produce " + artifact_name;
    return error;
}

ConversionError ErrorClassifier::unexpectedFault(const std::string &stage_name, const std::exception &e) const
{
    ConversionError error;
    error.stage_name = stage_name;
    error.kind = dynamic_cast<const std::filesystem::filesystem_error *>(&e) != nullptr
                     ? ConversionErrorKind::IO_ERROR
                     : ConversionErrorKind::STAGE_FAILURE;
    error.message = std::string("unexpected fault: ") + e.what();
    return error;
}

std::string ErrorClassifier::excerpt(const std::string &output) const
{
    std::string trimmed = trimWhitespace(output);
    if (trimmed.size() <= excerpt_bytes_)
    {
        return trimmed;
    }
    return "..." + trimmed.substr(trimmed.size() - excerpt_bytes_);
}
