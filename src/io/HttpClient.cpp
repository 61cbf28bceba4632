#include "HttpClient.h"

namespace
{
    juce::String formatHeaders(const juce::StringPairArray& headers)
    {
        juce::String result;

        for (int i = 0; i < headers.size(); ++i)
            result << headers.getAllKeys()[i] << ": " << headers.getAllValues()[i] << "\r\n";

        return result;
    }

    juce::String describeUrl(const juce::URL& url)
    {
        // Never log query strings, they may carry signatures
        return url.toString(false).upToFirstOccurrenceOf("?", false, false);
    }
}

HttpClient::Request HttpClient::makeJsonPost(const juce::URL& url, const juce::var& json, int timeoutMs)
{
    Request request;
    request.method = "POST";
    request.url = url;
    request.timeoutMs = timeoutMs;
    request.headers.set("Content-Type", "application/json");

    const juce::String text = juce::JSON::toString(json, true);
    request.body.append(text.toRawUTF8(), text.getNumBytesAsUTF8());
    return request;
}

//==============================================================================
juce::Result JuceHttpClient::send(const Request& request, Response& response)
{
    response = Response();

    juce::URL url = request.url;
    const bool hasBody = request.body.getSize() > 0;

    if (hasBody)
        url = url.withPOSTData(request.body);

    int statusCode = 0;
    auto options = juce::URL::InputStreamOptions(hasBody ? juce::URL::ParameterHandling::inPostData
                                                         : juce::URL::ParameterHandling::inAddress)
                       .withExtraHeaders(formatHeaders(request.headers))
                       .withConnectionTimeoutMs(request.timeoutMs)
                       .withStatusCode(&statusCode)
                       .withNumRedirectsToFollow(5)
                       .withHttpRequestCmd(request.method);

    std::unique_ptr<juce::InputStream> stream = url.createInputStream(options);

    if (stream == nullptr)
        return juce::Result::fail(request.method + " " + describeUrl(request.url) + " failed: no connection"
                                  + (statusCode != 0 ? " (HTTP " + juce::String(statusCode) + ")" : juce::String()));

    stream->readIntoMemoryBlock(response.body);
    response.statusCode = statusCode;
    return juce::Result::ok();
}

juce::Result JuceHttpClient::download(const juce::URL& url, const juce::File& destination, int timeoutMs)
{
    const juce::uint32 startTime = juce::Time::getMillisecondCounter();

    int statusCode = 0;
    auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inAddress)
                       .withConnectionTimeoutMs(timeoutMs)
                       .withStatusCode(&statusCode)
                       .withNumRedirectsToFollow(5);

    std::unique_ptr<juce::InputStream> stream = url.createInputStream(options);

    if (stream == nullptr)
        return juce::Result::fail("Download of " + describeUrl(url) + " failed: no connection");

    if (statusCode < 200 || statusCode >= 300)
        return juce::Result::fail("Download of " + describeUrl(url) + " failed: HTTP " + juce::String(statusCode));

    destination.deleteFile();
    juce::FileOutputStream output(destination, downloadChunkSize);

    if (!output.openedOk())
        return juce::Result::fail("Cannot write " + destination.getFullPathName() + ": " + output.getStatus().getErrorMessage());

    juce::HeapBlock<char> chunk((size_t) downloadChunkSize);

    while (!stream->isExhausted())
    {
        if (juce::Time::getMillisecondCounter() - startTime > (juce::uint32) timeoutMs)
            return juce::Result::fail("Download of " + describeUrl(url) + " timed out after "
                                      + juce::String(timeoutMs / 1000) + " seconds");

        const int bytesRead = stream->read(chunk.getData(), downloadChunkSize);
        if (bytesRead < 0)
            return juce::Result::fail("Download of " + describeUrl(url) + " failed while reading");

        if (bytesRead == 0)
            break;

        if (!output.write(chunk.getData(), (size_t) bytesRead))
            return juce::Result::fail("Cannot write " + destination.getFullPathName());
    }

    output.flush();

    if (output.getStatus().failed())
        return juce::Result::fail("Cannot write " + destination.getFullPathName() + ": " + output.getStatus().getErrorMessage());

    return juce::Result::ok();
}
