#include <gtest/gtest.h>
#include "TestFakes.h"
#include "rendering/ClipProcessor.h"
#include "rendering/EncodingParams.h"

using namespace storyreel_test;
using RenderTypes::AnimationType;

namespace {

juce::String valueAfter(const juce::StringArray& args, const juce::String& option) {
  const int index = args.indexOf(option);
  return (index >= 0 && index + 1 < args.size()) ? args[index + 1] : juce::String();
}

RenderTypes::ClipPlan makePlan(const RenderTypes::AssetSource& source, double duration, AnimationType animation) {
  RenderTypes::ClipPlan plan;
  plan.item.position = 0;
  plan.item.assetId = "a1";
  plan.item.durationSec = duration;
  plan.item.animation = animation;
  plan.source = source;
  return plan;
}

// -----------------------------------------------------------------------------
// Strategy selection
// -----------------------------------------------------------------------------
TEST(ClipProcessorTest, CompletedVideoSelectsLoopStrategy) {
  RenderTypes::AssetSource video = RenderTypes::VideoLoopSource { "https://cdn.example.com/a.mp4" };
  RenderTypes::AssetSource image = RenderTypes::StillImageSource { smallPngDataUrl() };

  EXPECT_EQ(ClipProcessor::strategyFor(video), ClipProcessor::Strategy::LoopFromVideo);
  EXPECT_EQ(ClipProcessor::strategyFor(image), ClipProcessor::Strategy::AnimateFromImage);
}

// -----------------------------------------------------------------------------
// Argument lists
// -----------------------------------------------------------------------------
TEST(ClipProcessorTest, LoopFromVideoLoopsSourceAndPinsFrameCount) {
  ClipProcessor processor(nullptr);
  const auto args = processor.buildLoopFromVideoArguments(juce::File("/work/src_000.mp4"), 2.5,
                                                          juce::File("/work/clip_000.mp4"), false);

  EXPECT_EQ(valueAfter(args, "-stream_loop"), "-1");
  EXPECT_EQ(valueAfter(args, "-t"), "2.500");
  EXPECT_EQ(valueAfter(args, "-frames:v"), "75");
  EXPECT_EQ(valueAfter(args, "-r"), "30");
  EXPECT_EQ(valueAfter(args, "-c:v"), "libx264");
  EXPECT_EQ(valueAfter(args, "-pix_fmt"), "yuv420p");
  EXPECT_EQ(valueAfter(args, "-movflags"), "+faststart");
  EXPECT_TRUE(args.contains("-an"));
  EXPECT_TRUE(valueAfter(args, "-vf").startsWith("scale=1920:1080:force_original_aspect_ratio=decrease"));
  EXPECT_EQ(args[args.size() - 1], "/work/clip_000.mp4");
}

TEST(ClipProcessorTest, AnimateFromImageLoopsStillAndAppendsMotion) {
  ClipProcessor processor(nullptr);
  const auto args = processor.buildAnimateFromImageArguments(juce::File("/work/src_000.png"), AnimationType::ZoomIn,
                                                             3.0, juce::File("/work/clip_000.mp4"), false);

  EXPECT_EQ(valueAfter(args, "-loop"), "1");
  EXPECT_EQ(valueAfter(args, "-framerate"), "30");
  EXPECT_EQ(valueAfter(args, "-frames:v"), "90");
  EXPECT_TRUE(valueAfter(args, "-vf").contains(",fps=30,zoompan=z='min(1+0.25*on/89,1.25)'"));
}

TEST(ClipProcessorTest, StaticImageHasNoMotionFilter) {
  ClipProcessor processor(nullptr);
  const auto args = processor.buildAnimateFromImageArguments(juce::File("/work/src_000.png"), AnimationType::None,
                                                             1.0, juce::File("/work/clip_000.mp4"), false);

  EXPECT_FALSE(valueAfter(args, "-vf").contains("zoompan"));
  EXPECT_FALSE(valueAfter(args, "-vf").contains("fade"));
}

TEST(ClipProcessorTest, RenderSettingsDriveGeometry) {
  ClipProcessor processor(nullptr);
  processor.setRenderSettings(RenderTypes::RenderSettings::create(RenderTypes::OutputFormat::Vertical,
                                                                  RenderTypes::QualityPreset::Standard, false));

  const auto args = processor.buildAnimateFromImageArguments(juce::File("/work/src.png"), AnimationType::PanUp,
                                                             1.0, juce::File("/work/out.mp4"), false);

  EXPECT_TRUE(valueAfter(args, "-vf").contains("pad=1080:1920"));
  EXPECT_TRUE(valueAfter(args, "-vf").contains(":s=1080x1920:"));
}

TEST(ClipProcessorTest, EncoderParamsDropConflictingOptions) {
  const auto args = EncodingParams::buildVideoEncoderArguments("-c:v libx265 -preset slow -pix_fmt yuv444p -an -crf 20",
                                                               false, EncodingParams::defaultClipCpuParams);

  EXPECT_EQ(args.joinIntoString(" "), "-c:v libx264 -preset slow -crf 20 -pix_fmt yuv420p");
}

TEST(ClipProcessorTest, EmptyEncoderParamsUseFallback) {
  const auto args = EncodingParams::buildVideoEncoderArguments({}, true, EncodingParams::defaultClipNvidiaParams);

  EXPECT_EQ(args[1], "h264_nvenc");
  EXPECT_TRUE(args.contains("-qp"));
}

// -----------------------------------------------------------------------------
// Synthesis through the executor
// -----------------------------------------------------------------------------
TEST(ClipProcessorTest, SynthesizeClipReportsExactFrameCount) {
  ScopedTempDirectory temp;
  auto state = std::make_shared<FakeToolState>();
  FakeFFmpegExecutor executor(state);
  ClipProcessor processor(&executor);

  const auto source = temp.get().getChildFile("src_000.png");
  ASSERT_TRUE(source.replaceWithText("png"));

  RenderTypes::Clip clip;
  const auto result = processor.synthesizeClip(
      makePlan(RenderTypes::StillImageSource { smallPngDataUrl() }, 3.0, AnimationType::ZoomIn),
      source, temp.get().getChildFile("clip_000.mp4"), clip);

  ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
  EXPECT_EQ(clip.frameCount, 90);
  EXPECT_DOUBLE_EQ(clip.durationSec, 3.0);
  EXPECT_TRUE(clip.file.existsAsFile());
  EXPECT_EQ(state->getCommands().size(), 1u);
}

TEST(ClipProcessorTest, NvencFailureRetriesWithLibx264) {
  ScopedTempDirectory temp;
  auto state = std::make_shared<FakeToolState>();
  state->failCommandIndex = 0;
  FakeFFmpegExecutor executor(state);
  ClipProcessor processor(&executor);
  processor.setRenderSettings(RenderTypes::RenderSettings::create(RenderTypes::OutputFormat::Horizontal,
                                                                  RenderTypes::QualityPreset::Standard, true));

  const auto source = temp.get().getChildFile("src_000.mp4");
  ASSERT_TRUE(source.replaceWithText("mp4"));

  RenderTypes::Clip clip;
  const auto result = processor.synthesizeClip(
      makePlan(RenderTypes::VideoLoopSource { "https://cdn.example.com/a.mp4" }, 2.0, AnimationType::None),
      source, temp.get().getChildFile("clip_000.mp4"), clip);

  ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
  const auto commands = state->getCommands();
  ASSERT_EQ(commands.size(), 2u);
  EXPECT_EQ(valueAfter(commands[0], "-c:v"), "h264_nvenc");
  EXPECT_EQ(valueAfter(commands[1], "-c:v"), "libx264");
}

TEST(ClipProcessorTest, EncoderFailureFailsTheClip) {
  ScopedTempDirectory temp;
  auto state = std::make_shared<FakeToolState>();
  state->failCommandIndex = 0;
  FakeFFmpegExecutor executor(state);
  ClipProcessor processor(&executor);

  const auto source = temp.get().getChildFile("src_000.png");
  ASSERT_TRUE(source.replaceWithText("png"));

  RenderTypes::Clip clip;
  const auto result = processor.synthesizeClip(
      makePlan(RenderTypes::StillImageSource { smallPngDataUrl() }, 1.0, AnimationType::None),
      source, temp.get().getChildFile("clip_000.mp4"), clip);

  EXPECT_TRUE(result.failed());
  EXPECT_TRUE(executor.getLastDiagnosticTail().contains("simulated failure"));
}

TEST(ClipProcessorTest, MissingSourceFailsWithoutRunningFFmpeg) {
  ScopedTempDirectory temp;
  auto state = std::make_shared<FakeToolState>();
  FakeFFmpegExecutor executor(state);
  ClipProcessor processor(&executor);

  RenderTypes::Clip clip;
  const auto result = processor.synthesizeClip(
      makePlan(RenderTypes::StillImageSource { smallPngDataUrl() }, 1.0, AnimationType::None),
      temp.get().getChildFile("absent.png"), temp.get().getChildFile("clip_000.mp4"), clip);

  EXPECT_TRUE(result.failed());
  EXPECT_TRUE(state->getCommands().empty());
}

}  // namespace
