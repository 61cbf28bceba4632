#include "CallbackNotifier.h"

CallbackNotifier::CallbackNotifier(HttpClient& httpClient, const juce::String& internalSecret)
    : httpClient(httpClient),
      internalSecret(internalSecret)
{
}

void CallbackNotifier::notify(const juce::String& callbackUrl, const RenderTypes::CallbackReport& report)
{
    const juce::String label = "[RENDER " + report.renderId + "] ";

    if (internalSecret.isEmpty())
    {
        juce::Logger::writeToLog(label + "WARNING: no internal secret configured; callback skipped");
        return;
    }

    auto request = HttpClient::makeJsonPost(juce::URL(callbackUrl), report.toJson(), timeoutMs);
    request.headers.set(RenderTypes::internalSecretHeader, internalSecret);

    HttpClient::Response response;
    auto result = httpClient.send(request, response);

    if (result.failed())
        juce::Logger::writeToLog(label + "WARNING: callback delivery failed: " + result.getErrorMessage());
    else if (!response.isSuccess())
        juce::Logger::writeToLog(label + "WARNING: callback returned HTTP " + juce::String(response.statusCode));
    else
        juce::Logger::writeToLog(label + "Callback delivered (" + juce::String(report.complete ? "complete" : "failed") + ")");
}
