#pragma once
#include <JuceHeader.h>

/** One parsed inbound HTTP/1.1 request */
struct HttpRequest
{
    juce::String method;
    juce::String path;              // Without the query string
    juce::StringPairArray headers;  // Lower-case names
    juce::MemoryBlock body;

    juce::String getHeader(const juce::String& name) const { return headers[name.toLowerCase()]; }
    juce::String getBodyAsString() const { return body.toString(); }
};

/** A JSON response ready to be written to the connection */
struct HttpResponse
{
    int statusCode = 200;
    juce::var body;

    static HttpResponse json(int statusCode, const juce::var& body);

    /** {"error": message} with the given status */
    static HttpResponse error(int statusCode, const juce::String& message);
};

//==============================================================================
/**
 * Minimal HTTP/1.1 framing for the worker's listener: one request per connection,
 * Content-Length bodies only.
 */
class HttpMessage
{
public:
    static constexpr int maxHeaderSize = 16 * 1024;
    static constexpr int maxBodySize = 1024 * 1024;

    enum class ParseStatus
    {
        Complete,
        Incomplete,     // Read more bytes and try again
        Malformed,
        TooLarge
    };

    /**
     * Parses everything received so far on a connection.
     * @param request Filled in when the result is Complete
     */
    static ParseStatus parseRequest(const juce::MemoryBlock& received, HttpRequest& request);

    /** Status line, headers (Content-Type, Content-Length, Connection: close) and JSON body */
    static juce::MemoryBlock formatResponse(const HttpResponse& response);

    static juce::String getReasonPhrase(int statusCode);
};
