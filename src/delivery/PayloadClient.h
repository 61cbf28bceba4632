#pragma once
#include <JuceHeader.h>
#include "../io/HttpClient.h"
#include "../rendering/RenderTypes.h"

/**
 * Retrieves a job's render payload from the web tier and turns the JSON into
 * typed storyboard items and a typed asset table.
 */
class PayloadClient
{
public:
    static constexpr int timeoutMs = 60 * 1000;
    static constexpr double defaultItemDuration = 5.0;

    PayloadClient(HttpClient& httpClient, const juce::String& internalSecret);

    /**
     * POSTs {userId, renderId} with the shared-secret header and parses the reply.
     */
    juce::Result fetch(const RenderTypes::RenderJob& job, RenderTypes::RenderPayload& payload);

    /**
     * Parses a payload object. Only a non-object body is an error here; missing
     * fields are left empty for the orchestrator to judge.
     */
    static juce::Result parsePayload(const juce::var& json, RenderTypes::RenderPayload& payload);

    /** Duration, then animateType / animation / animate, with the documented defaults */
    static RenderTypes::StoryboardItem parseStoryboardItem(const juce::var& item, int position);

    /**
     * Resolves one asset entry: a completed animation with an http(s) video wins,
     * otherwise a non-empty data URL; anything else is unresolvable (returns false).
     */
    static bool parseAssetSource(const juce::var& asset, RenderTypes::AssetSource& source);

private:
    HttpClient& httpClient;
    juce::String internalSecret;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PayloadClient)
};
