#pragma once
#include <JuceHeader.h>
#include "../io/HttpClient.h"
#include "../rendering/RenderTypes.h"

/**
 * Delivers a job's CallbackReport. Delivery is best effort: failures are logged
 * and never reach the job, which has already finished.
 */
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(const juce::String& callbackUrl, const RenderTypes::CallbackReport& report) = 0;
};

//==============================================================================
/**
 * POSTs the report as JSON to the caller-supplied callback location.
 */
class CallbackNotifier : public Notifier
{
public:
    static constexpr int timeoutMs = 30 * 1000;

    CallbackNotifier(HttpClient& httpClient, const juce::String& internalSecret);

    void notify(const juce::String& callbackUrl, const RenderTypes::CallbackReport& report) override;

private:
    HttpClient& httpClient;
    juce::String internalSecret;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CallbackNotifier)
};
