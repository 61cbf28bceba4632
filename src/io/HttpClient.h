#pragma once
#include <JuceHeader.h>

/**
 * Outbound HTTP used by the worker: payload retrieval, callbacks, asset downloads
 * and object-store uploads.
 *
 * Every call is blocking with a fixed timeout and is never retried here. The
 * interface exists so the pipeline can run against an in-memory fake.
 */
class HttpClient
{
public:
    struct Request
    {
        juce::String method = "GET";
        juce::URL url;
        juce::StringPairArray headers;
        juce::MemoryBlock body;
        int timeoutMs = 30000;
    };

    struct Response
    {
        int statusCode = 0;
        juce::MemoryBlock body;

        bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
        juce::String getBodyAsString() const { return body.toString(); }
    };

    virtual ~HttpClient() = default;

    /**
     * Sends a request and reads the whole response body into memory.
     * Fails when no connection could be made; HTTP error statuses are returned
     * in the response for the caller to judge.
     */
    virtual juce::Result send(const Request& request, Response& response) = 0;

    /**
     * Streams a GET response to a file in fixed-size chunks.
     * Fails on connection errors, non-2xx statuses, write errors or when the whole
     * transfer takes longer than timeoutMs.
     */
    virtual juce::Result download(const juce::URL& url, const juce::File& destination, int timeoutMs) = 0;

    /** Builds a request carrying a JSON body */
    static Request makeJsonPost(const juce::URL& url, const juce::var& json, int timeoutMs);
};

//==============================================================================
/**
 * HttpClient backed by juce::URL (libcurl on Linux).
 */
class JuceHttpClient : public HttpClient
{
public:
    static constexpr int downloadChunkSize = 1024 * 1024;

    JuceHttpClient() = default;

    juce::Result send(const Request& request, Response& response) override;
    juce::Result download(const juce::URL& url, const juce::File& destination, int timeoutMs) override;

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceHttpClient)
};
