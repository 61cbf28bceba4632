#include "ClipProcessor.h"
#include "EncodingParams.h"
#include "MotionPlanner.h"

ClipProcessor::ClipProcessor(FFmpegExecutor* ffmpegExecutor)
    : ffmpegExecutor(ffmpegExecutor)
{
}

ClipProcessor::~ClipProcessor()
{
}

void ClipProcessor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void ClipProcessor::setRenderSettings(const RenderTypes::RenderSettings& newSettings)
{
    settings = newSettings;
}

void ClipProcessor::setEncodingParams(const juce::String& newNvidiaParams, const juce::String& newCpuParams)
{
    nvidiaParams = newNvidiaParams;
    cpuParams = newCpuParams;
}

ClipProcessor::Strategy ClipProcessor::strategyFor(const RenderTypes::AssetSource& source)
{
    return std::holds_alternative<RenderTypes::VideoLoopSource>(source) ? Strategy::LoopFromVideo
                                                                        : Strategy::AnimateFromImage;
}

juce::StringArray ClipProcessor::buildEncodingArguments(bool useNvenc) const
{
    if (useNvenc)
        return EncodingParams::buildVideoEncoderArguments(nvidiaParams, true, EncodingParams::defaultClipNvidiaParams);

    return EncodingParams::buildVideoEncoderArguments(cpuParams, false, EncodingParams::defaultClipCpuParams);
}

juce::StringArray ClipProcessor::buildLoopFromVideoArguments(const juce::File& sourceVideo,
                                                             double durationSec,
                                                             const juce::File& outputFile,
                                                             bool useNvenc) const
{
    const int frameCount = MotionPlanner::frameCountFor(durationSec, settings.frameRate);
    const juce::String fps(settings.frameRate);

    juce::StringArray args { "-y", "-hide_banner",
                             "-stream_loop", "-1",
                             "-i", sourceVideo.getFullPathName(),
                             "-t", juce::String(durationSec, 3),
                             "-vf", MotionPlanner::buildLetterboxFilter(settings) + ",fps=" + fps,
                             "-an",
                             "-r", fps,
                             "-frames:v", juce::String(frameCount) };

    args.addArray(buildEncodingArguments(useNvenc));
    args.add("-movflags");
    args.add("+faststart");
    args.add(outputFile.getFullPathName());
    return args;
}

juce::StringArray ClipProcessor::buildAnimateFromImageArguments(const juce::File& sourceImage,
                                                                RenderTypes::AnimationType animation,
                                                                double durationSec,
                                                                const juce::File& outputFile,
                                                                bool useNvenc) const
{
    const int frameCount = MotionPlanner::frameCountFor(durationSec, settings.frameRate);
    const juce::String fps(settings.frameRate);

    juce::String filter = MotionPlanner::buildLetterboxFilter(settings) + ",fps=" + fps;
    const juce::String motion = MotionPlanner::buildMotionFilter(animation, durationSec, settings);
    if (motion.isNotEmpty())
        filter += "," + motion;

    juce::StringArray args { "-y", "-hide_banner",
                             "-framerate", fps,
                             "-loop", "1",
                             "-t", juce::String(durationSec, 3),
                             "-i", sourceImage.getFullPathName(),
                             "-vf", filter,
                             "-an",
                             "-r", fps,
                             "-frames:v", juce::String(frameCount) };

    args.addArray(buildEncodingArguments(useNvenc));
    args.add("-movflags");
    args.add("+faststart");
    args.add(outputFile.getFullPathName());
    return args;
}

juce::Result ClipProcessor::synthesizeClip(const RenderTypes::ClipPlan& plan,
                                           const juce::File& sourceFile,
                                           const juce::File& outputFile,
                                           RenderTypes::Clip& clip)
{
    const auto& item = plan.item;
    const Strategy strategy = strategyFor(plan.source);
    const int frameCount = MotionPlanner::frameCountFor(item.durationSec, settings.frameRate);

    if (!sourceFile.existsAsFile())
        return juce::Result::fail("Source for storyboard item " + juce::String(item.position) + " is missing");

    if (logCallback)
        logCallback("Clip " + juce::String(item.position) + ": "
                    + (strategy == Strategy::LoopFromVideo ? "loop video" : "animate image (" + RenderTypes::animationName(item.animation) + ")")
                    + ", " + juce::String(item.durationSec, 3) + "s, " + juce::String(frameCount) + " frames");

    auto buildArguments = [&](bool useNvenc)
    {
        if (strategy == Strategy::LoopFromVideo)
            return buildLoopFromVideoArguments(sourceFile, item.durationSec, outputFile, useNvenc);

        return buildAnimateFromImageArguments(sourceFile, item.animation, item.durationSec, outputFile, useNvenc);
    };

    bool success = ffmpegExecutor->executeCommand(buildArguments(settings.useNvidiaAcceleration));

    if (!success && settings.useNvidiaAcceleration)
    {
        if (logCallback)
            logCallback("WARNING: NVENC encode of clip " + juce::String(item.position) + " failed; retrying with libx264");

        outputFile.deleteFile();
        success = ffmpegExecutor->executeCommand(buildArguments(false));
    }

    if (!success)
        return juce::Result::fail("ffmpeg failed to synthesize clip for storyboard item " + juce::String(item.position)
                                  + " (exit code " + juce::String(ffmpegExecutor->getLastExitCode()) + ")");

    if (!outputFile.existsAsFile() || outputFile.getSize() == 0)
        return juce::Result::fail("ffmpeg produced no clip for storyboard item " + juce::String(item.position));

    clip.position = item.position;
    clip.file = outputFile;
    clip.durationSec = item.durationSec;
    clip.frameCount = frameCount;
    return juce::Result::ok();
}
