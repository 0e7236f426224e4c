#include "core/pipeline_planner.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace
{
    const char *const INPUT_PLACEHOLDER = "{input}";
    const char *const OUTPUT_PLACEHOLDER = "{output}";

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string &value)
    {
        auto first = value.find_first_not_of(" \t");
        if (first == std::string::npos)
        {
            return "";
        }
        auto last = value.find_last_not_of(" \t");
        return value.substr(first, last - first + 1);
    }

    // Every strategy reads {input} (HEIC) and writes {output} (PNG bridge)
    const std::map<HeicDecodeStrategy, StageSpec> &decodeStrategies()
    {
        static const std::map<HeicDecodeStrategy, StageSpec> strategies = {
            {HeicDecodeStrategy::LIBHEIF,
             StageSpec{PipelinePlanner::DECODE_STAGE, "heif-dec",
                       {INPUT_PLACEHOLDER, OUTPUT_PLACEHOLDER},
                       ArtifactRole::SOURCE, ArtifactRole::BRIDGE}},
            {HeicDecodeStrategy::FFMPEG,
             StageSpec{PipelinePlanner::DECODE_STAGE, "ffmpeg",
                       {"-hide_banner", "-loglevel", "error", "-y", "-i", INPUT_PLACEHOLDER, "-frames:v", "1", OUTPUT_PLACEHOLDER},
                       ArtifactRole::SOURCE, ArtifactRole::BRIDGE}},
        };
        return strategies;
    }
}

std::optional<InputFormat> parseInputFormat(const std::string &tag)
{
    std::string normalized = toLower(trim(tag));
    if (normalized == "jpeg")
    {
        return InputFormat::JPEG;
    }
    if (normalized == "heic")
    {
        return InputFormat::HEIC;
    }
    return std::nullopt;
}

std::optional<std::string> formatTagFromMimeType(const std::string &mime_type)
{
    std::string normalized = toLower(trim(mime_type));
    // Drop parameters such as "; charset=binary"
    auto semicolon = normalized.find(';');
    if (semicolon != std::string::npos)
    {
        normalized = trim(normalized.substr(0, semicolon));
    }

    if (normalized == "image/jpeg")
    {
        return std::string("jpeg");
    }
    if (normalized == "image/heic" || normalized == "image/heif")
    {
        return std::string("heic");
    }
    return std::nullopt;
}

const char *inputFormatToString(InputFormat format)
{
    switch (format)
    {
    case InputFormat::JPEG:
        return "jpeg";
    case InputFormat::HEIC:
        return "heic";
    }
    return "unknown";
}

std::optional<HeicDecodeStrategy> parseHeicDecodeStrategy(const std::string &name)
{
    std::string normalized = toLower(trim(name));
    if (normalized == "libheif")
    {
        return HeicDecodeStrategy::LIBHEIF;
    }
    if (normalized == "ffmpeg")
    {
        return HeicDecodeStrategy::FFMPEG;
    }
    return std::nullopt;
}

const char *heicDecodeStrategyToString(HeicDecodeStrategy strategy)
{
    switch (strategy)
    {
    case HeicDecodeStrategy::LIBHEIF:
        return "libheif";
    case HeicDecodeStrategy::FFMPEG:
        return "ffmpeg";
    }
    return "unknown";
}

std::vector<std::string> StageSpec::resolveArguments(const std::string &input_path, const std::string &output_path) const
{
    std::vector<std::string> resolved;
    resolved.reserve(arguments.size());
    for (const auto &arg : arguments)
    {
        if (arg == INPUT_PLACEHOLDER)
        {
            resolved.push_back(input_path);
        }
        else if (arg == OUTPUT_PLACEHOLDER)
        {
            resolved.push_back(output_path);
        }
        else
        {
            resolved.push_back(arg);
        }
    }
    return resolved;
}

std::string PipelinePlan::artifactName(ArtifactRole role) const
{
    switch (role)
    {
    case ArtifactRole::SOURCE:
        return format == InputFormat::HEIC ? "input.heic" : "input.jpg";
    case ArtifactRole::BRIDGE:
        return "bridge.png";
    case ArtifactRole::OUTPUT:
        return "output.avif";
    }
    return "artifact.bin";
}

PipelinePlanner::PipelinePlanner(HeicDecodeStrategy heic_strategy)
    : heic_strategy_(heic_strategy)
{
}

PipelinePlan PipelinePlanner::plan(InputFormat format) const
{
    PipelinePlan plan;
    plan.format = format;

    switch (format)
    {
    case InputFormat::JPEG:
        plan.stages.push_back(encodeStage(ArtifactRole::SOURCE));
        break;
    case InputFormat::HEIC:
        plan.stages.push_back(decodeStage(heic_strategy_));
        plan.stages.push_back(encodeStage(ArtifactRole::BRIDGE));
        break;
    }
    return plan;
}

std::optional<PipelinePlan> PipelinePlanner::plan(const std::string &format_tag) const
{
    auto format = parseInputFormat(format_tag);
    if (!format)
    {
        return std::nullopt;
    }
    return plan(*format);
}

StageSpec PipelinePlanner::encodeStage(ArtifactRole input_role)
{
    return StageSpec{ENCODE_STAGE, "avifenc", {INPUT_PLACEHOLDER, OUTPUT_PLACEHOLDER}, input_role, ArtifactRole::OUTPUT};
}

StageSpec PipelinePlanner::decodeStage(HeicDecodeStrategy strategy)
{
    return decodeStrategies().at(strategy);
}

std::vector<std::string> PipelinePlanner::versionArguments(const std::string &tool_name)
{
    // ffmpeg only understands the single-dash form
    if (tool_name == "ffmpeg" || tool_name == "ffprobe")
    {
        return {"-version"};
    }
    return {"--version"};
}
