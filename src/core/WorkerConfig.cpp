#include "WorkerConfig.h"

WorkerConfig WorkerConfig::load(const std::function<juce::String(const juce::String&)>& lookup)
{
    WorkerConfig config;

    auto get = [&lookup](const char* name) { return lookup(name).trim(); };

    if (get("PORT").isNotEmpty())
        config.port = parsePort(get("PORT"));

    if (get("WORKSPACE_ROOT").isNotEmpty())
        config.workspaceRoot = juce::File::getCurrentWorkingDirectory().getChildFile(get("WORKSPACE_ROOT"));

    if (get("LOG_DIR").isNotEmpty())
        config.logDirectory = juce::File::getCurrentWorkingDirectory().getChildFile(get("LOG_DIR"));

    config.workerToken = get("RENDER_TOKEN");
    if (config.workerToken.isEmpty())
        config.workerToken = get("ASR_TOKEN");

    config.internalSecret = get("JWT_SECRET");

    config.storage.endpoint = get("R2_ENDPOINT");
    if (config.storage.endpoint.isEmpty() && get("R2_ACCOUNT_ID").isNotEmpty())
        config.storage.endpoint = "https://" + get("R2_ACCOUNT_ID") + ".r2.cloudflarestorage.com";

    config.storage.bucket = get("R2_BUCKET");
    config.storage.publicBaseUrl = get("R2_PUBLIC_BASE_URL");
    config.storage.credentials.accessKeyId = get("R2_ACCESS_KEY_ID");
    config.storage.credentials.secretAccessKey = get("R2_SECRET_ACCESS_KEY");

    config.ffmpegPath = get("FFMPEG_PATH");
    config.ffprobePath = get("FFPROBE_PATH");

    if (get("RENDER_FORMAT").isNotEmpty())
        config.formatName = get("RENDER_FORMAT");

    if (get("RENDER_QUALITY").isNotEmpty())
        config.qualityName = get("RENDER_QUALITY");

    config.useNvidiaAcceleration = isTruthy(get("RENDER_USE_NVENC"));
    config.clipNvidiaParams = get("RENDER_NVENC_PARAMS");
    config.clipCpuParams = get("RENDER_X264_PARAMS");

    const int staleHours = get("STALE_WORKSPACE_HOURS").getIntValue();
    if (staleHours > 0)
        config.staleWorkspaceHours = staleHours;

    return config;
}

WorkerConfig WorkerConfig::fromEnvironment()
{
    return load([](const juce::String& name)
    {
        return juce::SystemStats::getEnvironmentVariable(name, {});
    });
}

void WorkerConfig::applyArguments(const juce::ArgumentList& arguments)
{
    if (arguments.containsOption("--port"))
        port = parsePort(arguments.getValueForOption("--port"));

    if (arguments.containsOption("--workspace"))
        workspaceRoot = juce::File::getCurrentWorkingDirectory().getChildFile(arguments.getValueForOption("--workspace"));

    if (arguments.containsOption("--log-dir"))
        logDirectory = juce::File::getCurrentWorkingDirectory().getChildFile(arguments.getValueForOption("--log-dir"));

    if (arguments.containsOption("--format"))
        formatName = arguments.getValueForOption("--format");

    if (arguments.containsOption("--quality"))
        qualityName = arguments.getValueForOption("--quality");

    if (arguments.containsOption("--nvenc"))
        useNvidiaAcceleration = true;
}

juce::Result WorkerConfig::validate() const
{
    if (port <= 0)
        return juce::Result::fail("Invalid port: must be between 1 and 65535");

    RenderTypes::OutputFormat format;
    if (!RenderTypes::parseOutputFormat(formatName, format))
        return juce::Result::fail("Unknown output format '" + formatName + "' (horizontal, vertical or square)");

    RenderTypes::QualityPreset quality;
    if (!RenderTypes::parseQualityPreset(qualityName, quality))
        return juce::Result::fail("Unknown quality preset '" + qualityName + "' (basic, standard or pro)");

    return juce::Result::ok();
}

juce::StringArray WorkerConfig::describeWarnings() const
{
    juce::StringArray warnings;

    if (internalSecret.isEmpty())
        warnings.add("JWT_SECRET is not set: POST /render will answer 500");

    const auto missing = storage.getMissingFields();
    if (!missing.isEmpty())
        warnings.add("Object storage is not fully configured (missing " + missing.joinIntoString(", ")
                     + "): renders will fail at upload");

    return warnings;
}

RenderTypes::OutputFormat WorkerConfig::getOutputFormat() const
{
    auto format = RenderTypes::OutputFormat::Horizontal;
    RenderTypes::parseOutputFormat(formatName, format);
    return format;
}

RenderTypes::QualityPreset WorkerConfig::getQualityPreset() const
{
    auto quality = RenderTypes::QualityPreset::Standard;
    RenderTypes::parseQualityPreset(qualityName, quality);
    return quality;
}

bool WorkerConfig::isTruthy(const juce::String& text)
{
    const auto value = text.trim().toLowerCase();
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

int WorkerConfig::parsePort(const juce::String& text)
{
    const auto value = text.trim();

    if (value.isEmpty() || value.length() > 5 || !value.containsOnly("0123456789"))
        return -1;

    const int number = value.getIntValue();
    return (number >= 1 && number <= 65535) ? number : -1;
}
