#include <gtest/gtest.h>
#include "core/conversion_orchestrator.hpp"
#include "test_base.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <limits>
#include <thread>

namespace fs = std::filesystem;

class ConversionOrchestratorTest : public TestBase
{
protected:
    std::string markerPath() const { return getTestDir() + "/launched.marker"; }
};

TEST_F(ConversionOrchestratorTest, JpegConvertsInOneStage)
{
    installFakeEncoder(1024);
    ConversionOrchestrator orchestrator(makeSettings());

    ConversionOutcome outcome = orchestrator.convert(makeBytes(2 * 1024 * 1024), "jpeg", "photo.jpg");

    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->describe() : "");
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.final_state, ConversionState::COMPLETED);
    EXPECT_EQ(outcome.output.size(), 1024u);

    EXPECT_EQ(outcome.metrics.input_size, 2u * 1024 * 1024);
    EXPECT_EQ(outcome.metrics.output_size, 1024u);
    EXPECT_GT(outcome.metrics.compression_ratio, 0.0);
    EXPECT_LT(outcome.metrics.compression_ratio, 1.0);
    ASSERT_EQ(outcome.metrics.stages.size(), 1u);
    EXPECT_EQ(outcome.metrics.stages[0].stage_name, PipelinePlanner::ENCODE_STAGE);
    EXPECT_EQ(outcome.metrics.stages[0].exit_code, 0);
    EXPECT_GT(outcome.metrics.memory_start.system_total_bytes, 0u);
    EXPECT_GT(outcome.metrics.memory_end.system_total_bytes, 0u);

    EXPECT_FALSE(outcome.scratch_path.empty());
    EXPECT_FALSE(fs::exists(outcome.scratch_path));
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, HeicConvertsThroughBridge)
{
    installFakeHeifDecoder();
    installFakeEncoder(512);
    ConversionOrchestrator orchestrator(makeSettings());

    ConversionOutcome outcome = orchestrator.convert(makeBytes(64 * 1024), "heic", "IMG_0001.HEIC");

    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->describe() : "");
    ASSERT_EQ(outcome.metrics.stages.size(), 2u);
    EXPECT_EQ(outcome.metrics.stages[0].stage_name, PipelinePlanner::DECODE_STAGE);
    EXPECT_EQ(outcome.metrics.stages[1].stage_name, PipelinePlanner::ENCODE_STAGE);
    EXPECT_NE(outcome.metrics.stages[1].command_line.find("bridge.png"), std::string::npos);
    EXPECT_EQ(outcome.output.size(), 512u);
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, EmptyHeicFailsAtDecodeStage)
{
    installFakeHeifDecoder();
    installTool("avifenc", "touch '" + markerPath() + "'\nexit 0");
    ConversionOrchestrator orchestrator(makeSettings());

    ConversionOutcome outcome = orchestrator.convert(std::vector<uint8_t>(), "heic", "empty.heic");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::STAGE_FAILURE);
    EXPECT_EQ(outcome.error->stage_name, PipelinePlanner::DECODE_STAGE);
    EXPECT_EQ(outcome.error->exit_code, 1);
    EXPECT_NE(outcome.error->stderr_excerpt.find("No ftyp box"), std::string::npos);
    EXPECT_EQ(outcome.final_state, ConversionState::FAILED);
    EXPECT_TRUE(outcome.output.empty());

    // The encoder never ran
    EXPECT_EQ(outcome.metrics.stages.size(), 1u);
    EXPECT_FALSE(fs::exists(markerPath()));
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, UnsupportedFormatIsRejectedBeforeAnyWork)
{
    installTool("avifenc", "touch '" + markerPath() + "'\nexit 0");
    ConversionOrchestrator orchestrator(makeSettings());

    ConversionOutcome outcome = orchestrator.convert(makeBytes(1024), "png", "image.png");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::INPUT_ERROR);
    EXPECT_TRUE(outcome.error->isClientError());
    EXPECT_EQ(outcome.final_state, ConversionState::START);
    EXPECT_TRUE(outcome.scratch_path.empty());
    EXPECT_TRUE(outcome.metrics.stages.empty());

    EXPECT_FALSE(fs::exists(markerPath()));
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, MissingEncoderIsEnvironmentError)
{
    // Nothing but the empty fake bin directory on PATH
    setPath(binDir());
    ConversionOrchestrator orchestrator(makeSettings());

    EXPECT_FALSE(orchestrator.toolAvailable("avifenc"));

    ConversionOutcome outcome = orchestrator.convert(makeBytes(4096), "jpeg", "photo.jpg");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::ENVIRONMENT_ERROR);
    EXPECT_NE(outcome.error->message.find("avifenc"), std::string::npos);
    EXPECT_EQ(outcome.final_state, ConversionState::FAILED);
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, RepeatedConversionsProduceSameSize)
{
    installFakeEncoder(2048);
    ConversionOrchestrator orchestrator(makeSettings());

    auto input = makeBytes(100 * 1024, 0x42);
    ConversionOutcome first = orchestrator.convert(input, "jpeg", "a.jpg");
    ConversionOutcome second = orchestrator.convert(input, "jpeg", "a.jpg");

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.output.size(), second.output.size());
    EXPECT_NE(first.scratch_path, second.scratch_path);
}

TEST_F(ConversionOrchestratorTest, ConcurrentRequestsUseSeparateAreas)
{
    installFakeEncoder(256);
    ConversionOrchestrator orchestrator(makeSettings());

    ConversionOutcome left;
    ConversionOutcome right;
    std::thread a([&]()
                  { left = orchestrator.convert(makeBytes(8192), "jpeg", "left.jpg"); });
    std::thread b([&]()
                  { right = orchestrator.convert(makeBytes(8192), "jpeg", "right.jpg"); });
    a.join();
    b.join();

    EXPECT_TRUE(left.success);
    EXPECT_TRUE(right.success);
    EXPECT_NE(left.scratch_path, right.scratch_path);
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, ZeroExitWithoutOutputIsStageFailure)
{
    installTool("avifenc", "echo 'pretending to encode'\nexit 0");
    ConversionOrchestrator orchestrator(makeSettings());

    ConversionOutcome outcome = orchestrator.convert(makeBytes(1024), "jpeg", "photo.jpg");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::STAGE_FAILURE);
    EXPECT_NE(outcome.error->message.find("output.avif"), std::string::npos);
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, EncoderErrorOutputIsExcerpted)
{
    installTool("avifenc", "i=0\nwhile [ $i -lt 200 ]; do echo \"noise line $i\"; i=$((i+1)); done\n"
                           "echo 'ERROR: Unsupported color space' >&2\nexit 2");
    OrchestratorSettings settings = makeSettings();
    settings.stderr_excerpt_bytes = 128;
    ConversionOrchestrator orchestrator(settings);

    ConversionOutcome outcome = orchestrator.convert(makeBytes(1024), "jpeg", "photo.jpg");

    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->exit_code, 2);
    EXPECT_LE(outcome.error->stderr_excerpt.size(), 128u + 3u);
    EXPECT_NE(outcome.error->stderr_excerpt.find("Unsupported color space"), std::string::npos);
    ASSERT_EQ(outcome.metrics.stages.size(), 1u);
    EXPECT_LE(outcome.metrics.stages[0].output.size(), 128u + 3u);
}

TEST_F(ConversionOrchestratorTest, LowMemoryIsWarningNotFailure)
{
    installFakeEncoder(1024);
    OrchestratorSettings settings = makeSettings();
    settings.low_memory_threshold_bytes = std::numeric_limits<uint64_t>::max();
    ConversionOrchestrator orchestrator(settings);

    ConversionOutcome outcome = orchestrator.convert(makeBytes(4096), "jpeg", "photo.jpg");

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.metrics.low_memory_warning);
    EXPECT_FALSE(outcome.metrics.warnings.empty());
}

TEST_F(ConversionOrchestratorTest, LowMemoryDuringStageIsReported)
{
    installFakeEncoder(1024);
    OrchestratorSettings settings = makeSettings();
    settings.low_memory_threshold_bytes = std::numeric_limits<uint64_t>::max();
    ConversionOrchestrator orchestrator(settings);

    ConversionOutcome outcome = orchestrator.convert(makeBytes(4096), "jpeg", "photo.jpg");

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.metrics.stages.size(), 1u);
    if (outcome.metrics.memory_start.system_total_bytes == 0)
    {
        GTEST_SKIP() << "/proc/meminfo not readable";
    }
    EXPECT_GT(outcome.metrics.stages[0].min_system_available_bytes, 0u);

    const auto &warnings = outcome.metrics.warnings;
    EXPECT_NE(std::find_if(warnings.begin(), warnings.end(), [](const std::string &warning)
                           { return warning.find("during avif-encode") != std::string::npos; }),
              warnings.end());
}

TEST_F(ConversionOrchestratorTest, LowThresholdLeavesNoStageWarning)
{
    installFakeEncoder(1024);
    OrchestratorSettings settings = makeSettings();
    settings.low_memory_threshold_bytes = 1;
    ConversionOrchestrator orchestrator(settings);

    ConversionOutcome outcome = orchestrator.convert(makeBytes(4096), "jpeg", "photo.jpg");

    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.metrics.low_memory_warning);
    EXPECT_TRUE(outcome.metrics.warnings.empty());
}

TEST_F(ConversionOrchestratorTest, CancellationKillsRunningStage)
{
    installTool("avifenc", "exec sleep 30");
    ConversionOrchestrator orchestrator(makeSettings());

    CancellationToken token;
    std::thread canceller([&token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel(); });

    auto started = std::chrono::steady_clock::now();
    ConversionOutcome outcome = orchestrator.convert(ConversionRequest(makeBytes(1024), "jpeg", "slow.jpg"), &token);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::STAGE_FAILURE);
    EXPECT_NE(outcome.error->message.find("cancelled"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, CancelledTokenStopsBeforeFirstStage)
{
    installTool("avifenc", "touch '" + markerPath() + "'\nexit 0");
    ConversionOrchestrator orchestrator(makeSettings());

    CancellationToken token;
    token.cancel();
    ConversionOutcome outcome = orchestrator.convert(ConversionRequest(makeBytes(1024), "jpeg", "photo.jpg"), &token);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::STAGE_FAILURE);
    EXPECT_FALSE(fs::exists(markerPath()));
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, UnavailableScratchRootIsEnvironmentError)
{
    installFakeEncoder();
    OrchestratorSettings settings = makeSettings();
    settings.scratch_root = getTestDir() + "/missing-root";
    ConversionOrchestrator orchestrator(settings);

    ConversionOutcome outcome = orchestrator.convert(makeBytes(1024), "jpeg", "photo.jpg");

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ConversionErrorKind::ENVIRONMENT_ERROR);
    EXPECT_EQ(outcome.final_state, ConversionState::FAILED);
    EXPECT_TRUE(outcome.scratch_path.empty());
}

TEST_F(ConversionOrchestratorTest, ToolProbe)
{
    installFakeEncoder();
    installTool("broken-tool", "exit 1");
    ConversionOrchestrator orchestrator(makeSettings());

    EXPECT_TRUE(orchestrator.toolAvailable("avifenc"));
    EXPECT_FALSE(orchestrator.toolAvailable("broken-tool"));
    EXPECT_FALSE(orchestrator.toolAvailable("no-such-tool-avif-test"));
}

TEST_F(ConversionOrchestratorTest, HangingToolProbeTimesOut)
{
    installTool("hanging-tool", "exec sleep 30");
    ConversionOrchestrator orchestrator(makeSettings());

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(orchestrator.toolAvailable("hanging-tool"));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(ConversionOrchestratorTest, HangingWrapperToolIsUnavailable)
{
    // No exec: the shell's sleep keeps the output pipe open after the shell is killed
    installTool("hanging-wrapper", "sleep 30\necho late");
    ConversionOrchestrator orchestrator(makeSettings());

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(orchestrator.toolAvailable("hanging-wrapper"));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(6));
}

TEST_F(ConversionOrchestratorTest, CancellationKillsWrapperStage)
{
    installTool("avifenc", "sleep 30\nexit 0");
    ConversionOrchestrator orchestrator(makeSettings());

    CancellationToken token;
    std::thread canceller([&token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel(); });

    auto started = std::chrono::steady_clock::now();
    ConversionOutcome outcome = orchestrator.convert(ConversionRequest(makeBytes(1024), "jpeg", "slow.jpg"), &token);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->message.find("cancelled"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(scratchEntryCount(), 0u);
}

TEST_F(ConversionOrchestratorTest, RequiredToolsFollowDecodeStrategy)
{
    OrchestratorSettings settings = makeSettings();
    settings.heic_strategy = HeicDecodeStrategy::FFMPEG;
    ConversionOrchestrator orchestrator(settings);

    auto tools = orchestrator.requiredTools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0], "avifenc");
    EXPECT_EQ(tools[1], "ffmpeg");
}

TEST(ConversionStateTest, Names)
{
    EXPECT_STREQ(conversionStateToString(ConversionState::START), "start");
    EXPECT_STREQ(conversionStateToString(ConversionState::COMPLETED), "completed");
    EXPECT_STREQ(conversionStateToString(ConversionState::FAILED), "failed");
}
