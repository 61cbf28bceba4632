#include "TimelineAssembler.h"
#include "EncodingParams.h"

namespace
{
    juce::String doubledBitrate(const juce::String& bitrate)
    {
        const juce::String digits = bitrate.initialSectionContainingOnly("0123456789");
        const juce::String suffix = bitrate.substring(digits.length());
        return juce::String(digits.getIntValue() * 2) + suffix;
    }

    juce::String escapeConcatPath(const juce::String& path)
    {
        // ffconcat quoting: a single quote is written as '\''
        return path.replace("\\", "/").replace("'", "'\\''");
    }
}

TimelineAssembler::TimelineAssembler(FFmpegExecutor* executor)
    : ffmpegExecutor(executor)
{
}

TimelineAssembler::~TimelineAssembler()
{
}

void TimelineAssembler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void TimelineAssembler::setRenderSettings(const RenderTypes::RenderSettings& newSettings)
{
    settings = newSettings;
}

//==============================================================================
juce::StringArray TimelineAssembler::buildFinalEncodingArguments(bool useNvenc) const
{
    const juce::String rateControl = " -maxrate " + settings.maxVideoBitrate
                                   + " -bufsize " + doubledBitrate(settings.maxVideoBitrate);

    if (useNvenc)
        return EncodingParams::buildVideoEncoderArguments("-preset p5 -rc vbr -cq " + juce::String(settings.crf) + rateControl,
                                                          true, {});

    return EncodingParams::buildVideoEncoderArguments("-preset " + settings.x264Preset + " -crf " + juce::String(settings.crf) + rateControl,
                                                      false, {});
}

juce::StringArray TimelineAssembler::buildTimestampArguments() const
{
    return { "-r", juce::String(settings.frameRate),
             "-video_track_timescale", juce::String(settings.getTimescale()),
             "-movflags", "+faststart" };
}

double TimelineAssembler::getNominalDuration(const std::vector<RenderTypes::Clip>& clips) const
{
    juce::int64 totalFrames = 0;
    for (const auto& clip : clips)
        totalFrames += clip.frameCount;

    return (double) totalFrames / (double) settings.frameRate;
}

bool TimelineAssembler::createConcatFile(const std::vector<RenderTypes::Clip>& clips, const juce::File& concatFile)
{
    juce::String contents = "ffconcat version 1.0\n";

    for (const auto& clip : clips)
        contents << "file '" << escapeConcatPath(clip.file.getFullPathName()) << "'\n";

    return concatFile.replaceWithText(contents, false, false, "\n");
}

//==============================================================================
juce::StringArray TimelineAssembler::buildConcatArguments(const juce::File& concatList,
                                                          const juce::File& outputFile,
                                                          bool useNvenc) const
{
    const juce::String fps(settings.frameRate);

    juce::StringArray args { "-y", "-hide_banner",
                             "-f", "concat", "-safe", "0",
                             "-i", concatList.getFullPathName(),
                             "-vf", "setpts=N/" + fps + "/TB,fps=" + fps,
                             "-an" };

    args.addArray(buildFinalEncodingArguments(useNvenc));
    args.addArray(buildTimestampArguments());
    args.add(outputFile.getFullPathName());
    return args;
}

juce::StringArray TimelineAssembler::buildFilterConcatArguments(const std::vector<RenderTypes::Clip>& clips,
                                                                const juce::File& outputFile,
                                                                bool useNvenc) const
{
    const juce::String fps(settings.frameRate);
    juce::StringArray args { "-y", "-hide_banner" };
    juce::String inputs;

    for (size_t i = 0; i < clips.size(); ++i)
    {
        args.add("-i");
        args.add(clips[i].file.getFullPathName());
        inputs << "[" << (int) i << ":v]";
    }

    args.add("-filter_complex");
    args.add(inputs + "concat=n=" + juce::String((int) clips.size()) + ":v=1:a=0,"
             + "setpts=N/" + fps + "/TB,fps=" + fps + "[v]");
    args.add("-map");
    args.add("[v]");
    args.add("-an");

    args.addArray(buildFinalEncodingArguments(useNvenc));
    args.addArray(buildTimestampArguments());
    args.add(outputFile.getFullPathName());
    return args;
}

juce::StringArray TimelineAssembler::buildMuxArguments(const juce::File& sequenceFile,
                                                       const juce::File& audioFile,
                                                       double targetDuration,
                                                       const juce::File& outputFile) const
{
    juce::StringArray args { "-y", "-hide_banner",
                             "-i", sequenceFile.getFullPathName(),
                             "-i", audioFile.getFullPathName(),
                             "-map", "0:v:0", "-map", "1:a:0",
                             "-c:v", "copy",
                             "-c:a", "aac", "-b:a", settings.audioBitrate };

    if (targetDuration > 0.0)
    {
        args.add("-t");
        args.add(juce::String(targetDuration, 3));
    }

    args.add("-shortest");
    args.add("-video_track_timescale");
    args.add(juce::String(settings.getTimescale()));
    args.add("-movflags");
    args.add("+faststart");
    args.add(outputFile.getFullPathName());
    return args;
}

//==============================================================================
bool TimelineAssembler::executeConcatWithFallback(const std::vector<RenderTypes::Clip>& clips,
                                                  const juce::File& concatList,
                                                  const juce::File& outputFile,
                                                  bool useNvenc)
{
    if (ffmpegExecutor->executeCommand(buildConcatArguments(concatList, outputFile, useNvenc)))
        return true;

    if (logCallback) logCallback("WARNING: concat demuxer failed; retrying with the concat filter");

    outputFile.deleteFile();

    if (!ffmpegExecutor->executeCommand(buildFilterConcatArguments(clips, outputFile, useNvenc)))
    {
        if (logCallback) logCallback("ERROR: concatenating clips failed after retry");
        return false;
    }

    if (logCallback) logCallback("Retry succeeded for concatenating clips");
    return true;
}

juce::Result TimelineAssembler::concatenateClips(const std::vector<RenderTypes::Clip>& clips,
                                                 const juce::File& tempDirectory,
                                                 const juce::File& sequenceFile)
{
    juce::File concatFile = tempDirectory.getChildFile("clips.ffconcat");

    if (!createConcatFile(clips, concatFile))
        return juce::Result::fail("Failed to write concat list " + concatFile.getFullPathName());

    bool success = executeConcatWithFallback(clips, concatFile, sequenceFile, settings.useNvidiaAcceleration);

    if (!success && settings.useNvidiaAcceleration)
    {
        if (logCallback) logCallback("WARNING: NVENC sequence encode failed; retrying with libx264");
        sequenceFile.deleteFile();
        success = executeConcatWithFallback(clips, concatFile, sequenceFile, false);
    }

    if (!success)
        return juce::Result::fail("ffmpeg failed to concatenate " + juce::String((int) clips.size()) + " clips");

    if (!sequenceFile.existsAsFile() || sequenceFile.getSize() == 0)
        return juce::Result::fail("ffmpeg produced no concatenated sequence");

    return juce::Result::ok();
}

//==============================================================================
juce::Result TimelineAssembler::assembleTimeline(const std::vector<RenderTypes::Clip>& clips,
                                                 const juce::File& audioFile,
                                                 const juce::File& tempDirectory,
                                                 const juce::File& outputFile,
                                                 AssemblyReport& report)
{
    report = AssemblyReport();

    if (clips.empty())
        return juce::Result::fail("no clips produced");

    if (!audioFile.existsAsFile() || audioFile.getSize() == 0)
        return juce::Result::fail("Audio track is missing or empty");

    const double frameDuration = settings.getFrameDuration();
    report.expectedVideoDuration = getNominalDuration(clips);

    if (logCallback)
        logCallback("Assembling " + juce::String((int) clips.size()) + " clips, nominal duration "
                    + juce::String(report.expectedVideoDuration, 3) + "s");

    // STEP 1: silent sequence
    juce::File sequenceFile = tempDirectory.getChildFile("sequence.mp4");
    auto concatResult = concatenateClips(clips, tempDirectory, sequenceFile);
    if (concatResult.failed())
        return concatResult;

    // STEP 2: the concatenation must not have gained or lost time
    report.sequenceDuration = ffmpegExecutor->getFileDuration(sequenceFile);

    if (report.sequenceDuration > 0.0
        && std::abs(report.sequenceDuration - report.expectedVideoDuration) > frameDuration + 1.0e-3)
    {
        return juce::Result::fail("Concatenated sequence lasts " + juce::String(report.sequenceDuration, 3)
                                  + "s but the clips add up to " + juce::String(report.expectedVideoDuration, 3) + "s");
    }

    // STEP 3: mux against the narration, shortest stream wins
    const double videoDuration = report.sequenceDuration > 0.0 ? report.sequenceDuration : report.expectedVideoDuration;
    report.audioDuration = ffmpegExecutor->getFileDuration(audioFile);
    report.targetDuration = report.audioDuration > 0.0 ? juce::jmin(videoDuration, report.audioDuration) : videoDuration;

    if (logCallback)
        logCallback("Muxing: video " + juce::String(videoDuration, 3) + "s, audio "
                    + (report.audioDuration > 0.0 ? juce::String(report.audioDuration, 3) + "s" : juce::String("unknown"))
                    + ", target " + juce::String(report.targetDuration, 3) + "s");

    if (!ffmpegExecutor->executeCommand(buildMuxArguments(sequenceFile, audioFile,
                                                          report.audioDuration > 0.0 ? report.targetDuration : 0.0,
                                                          outputFile)))
    {
        return juce::Result::fail("ffmpeg failed to mux video with audio (exit code "
                                  + juce::String(ffmpegExecutor->getLastExitCode()) + ")");
    }

    if (!outputFile.existsAsFile() || outputFile.getSize() == 0)
        return juce::Result::fail("ffmpeg produced no output file");

    // STEP 4: measure what was written
    report.outputDuration = ffmpegExecutor->getFileDuration(outputFile);
    report.streamDescription = ffmpegExecutor->describeVideoStream(outputFile);

    if (report.outputDuration > 0.0 && report.outputDuration > report.targetDuration + frameDuration + 1.0e-3 && logCallback)
        logCallback("WARNING: output lasts " + juce::String(report.outputDuration, 3) + "s, expected at most "
                    + juce::String(report.targetDuration, 3) + "s");

    sequenceFile.deleteFile();

    if (logCallback)
        logCallback("Final output written: " + outputFile.getFullPathName() + " ("
                    + juce::String(outputFile.getSize() / 1024) + " KB)");

    return juce::Result::ok();
}
