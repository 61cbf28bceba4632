#pragma once
#include <JuceHeader.h>
#include "HttpMessage.h"
#include "../rendering/RenderManager.h"

/**
 * The worker's HTTP surface: GET /health and POST /render.
 *
 * Connections are accepted on a background thread and served one at a time, one
 * request per connection. POST /render only queues the job; the response is sent
 * before any pipeline step runs.
 */
class RenderServer : private juce::Thread
{
public:
    struct Settings
    {
        int port = 8000;
        juce::String workerToken;       // Empty: /render needs no bearer token
        juce::String internalSecret;    // Empty: /render answers 500
    };

    /** Time allowed for a client to send its whole request */
    static constexpr int requestTimeoutMs = 10 * 1000;

    RenderServer(RenderManager& renderManager, const Settings& settings);
    ~RenderServer() override;

    /** Binds the listening socket and starts accepting connections. */
    juce::Result start();

    /** Closes the listener and waits for the accept thread. Running jobs are untouched. */
    void stop();

    int getPort() const { return settings.port; }

    /** Routes one parsed request to its handler. */
    HttpResponse handleRequest(const HttpRequest& request);

    /** Checks the Authorization header against the configured worker token */
    bool isAuthorised(const HttpRequest& request) const;

    /**
     * Reads {renderId, userId, payloadUrl, callbackUrl} from a request body.
     */
    static juce::Result parseRenderRequest(const juce::String& body, RenderTypes::RenderJob& job);

private:
    void run() override;

    void handleConnection(juce::StreamingSocket& connection);
    void sendResponse(juce::StreamingSocket& connection, const HttpResponse& response);

    HttpResponse handleHealth();
    HttpResponse handleRender(const HttpRequest& request);

    RenderManager& renderManager;
    Settings settings;
    juce::StreamingSocket listener;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderServer)
};
