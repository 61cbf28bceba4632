#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"
#include "../delivery/ObjectStorage.h"

/**
 * Worker settings, read from the environment and overridden by command-line flags
 * of the form --name=value.
 */
struct WorkerConfig
{
    int port = 8000;                            // -1 when the configured value is not a port
    juce::File workspaceRoot { "/tmp/work" };
    juce::File logDirectory;                    // Defaults to <workspaceRoot>/logs
    juce::String workerToken;                   // Bearer token for POST /render; empty disables the check
    juce::String internalSecret;                // Shared with the web tier for payload and callback requests
    S3ObjectStorage::Settings storage;
    juce::String ffmpegPath;
    juce::String ffprobePath;
    juce::String formatName { "horizontal" };
    juce::String qualityName { "standard" };
    bool useNvidiaAcceleration = false;
    juce::String clipNvidiaParams;              // Extra h264_nvenc options for intermediate clips
    juce::String clipCpuParams;                 // Extra libx264 options for intermediate clips
    int staleWorkspaceHours = 24;

    /** Reads every setting through the given lookup (an environment variable name -> value) */
    static WorkerConfig load(const std::function<juce::String(const juce::String&)>& lookup);

    /** Reads the process environment */
    static WorkerConfig fromEnvironment();

    /** --port, --workspace, --log-dir, --format, --quality and --nvenc */
    void applyArguments(const juce::ArgumentList& arguments);

    /**
     * Fails on a bad port or an unknown format or quality name. Missing object-store
     * settings are only reported by describeWarnings(): those jobs fail at upload.
     */
    juce::Result validate() const;

    juce::StringArray describeWarnings() const;

    RenderTypes::OutputFormat getOutputFormat() const;
    RenderTypes::QualityPreset getQualityPreset() const;

    /** "1", "true", "yes" and "on" (any case) */
    static bool isTruthy(const juce::String& text);

    /** The port number, or -1 if the text is not one */
    static int parsePort(const juce::String& text);
};
