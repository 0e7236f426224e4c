#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Input formats the converter accepts
 */
enum class InputFormat
{
    JPEG,
    HEIC
};

/**
 * @brief Interchangeable ways of turning HEIC into the bridge image
 */
enum class HeicDecodeStrategy
{
    LIBHEIF, // heif-dec, libheif's still-image decoder
    FFMPEG   // ffmpeg used as an external transcoder
};

/**
 * @brief Files a stage reads or writes inside the scratch area
 */
enum class ArtifactRole
{
    SOURCE, // the staged upload
    BRIDGE, // decoded intermediate image
    OUTPUT  // the AVIF result
};

/**
 * @brief Parse a declared format tag ("jpeg", "heic"; case-insensitive)
 * @return Empty for anything outside the supported set
 */
std::optional<InputFormat> parseInputFormat(const std::string &tag);

/**
 * @brief Map an upload MIME type to a format tag
 * @return "jpeg", "heic", or empty when the MIME type is unsupported
 */
std::optional<std::string> formatTagFromMimeType(const std::string &mime_type);

const char *inputFormatToString(InputFormat format);

std::optional<HeicDecodeStrategy> parseHeicDecodeStrategy(const std::string &name);
const char *heicDecodeStrategyToString(HeicDecodeStrategy strategy);

/**
 * @brief One external tool invocation in a pipeline
 *
 * Arguments are a fixed template; the placeholders {input} and {output} are
 * replaced with scratch-area paths of input_role and output_role.
 */
struct StageSpec
{
    std::string name;
    std::string executable;
    std::vector<std::string> arguments;
    ArtifactRole input_role = ArtifactRole::SOURCE;
    ArtifactRole output_role = ArtifactRole::OUTPUT;

    std::vector<std::string> resolveArguments(const std::string &input_path, const std::string &output_path) const;
};

/**
 * @brief Ordered, immutable list of stages for one request
 */
struct PipelinePlan
{
    InputFormat format = InputFormat::JPEG;
    std::vector<StageSpec> stages;

    /**
     * @brief Fixed file name of an artifact role inside the scratch area
     */
    std::string artifactName(ArtifactRole role) const;
};

/**
 * @brief Selects the stage chain for an input format
 */
class PipelinePlanner
{
public:
    static constexpr const char *ENCODE_STAGE = "avif-encode";
    static constexpr const char *DECODE_STAGE = "heic-decode";

    explicit PipelinePlanner(HeicDecodeStrategy heic_strategy = HeicDecodeStrategy::LIBHEIF);

    PipelinePlan plan(InputFormat format) const;

    /**
     * @brief Build a plan straight from a declared tag
     * @return Empty for unsupported tags; no other work is done in that case
     */
    std::optional<PipelinePlan> plan(const std::string &format_tag) const;

    static StageSpec encodeStage(ArtifactRole input_role);
    static StageSpec decodeStage(HeicDecodeStrategy strategy);

    /**
     * @brief Argument that makes a tool print its version and exit 0
     */
    static std::vector<std::string> versionArguments(const std::string &tool_name);

private:
    HeicDecodeStrategy heic_strategy_;
};
