#include "RenderServer.h"

RenderServer::RenderServer(RenderManager& renderManager, const Settings& settings)
    : Thread("RenderServer"),
      renderManager(renderManager),
      settings(settings)
{
}

RenderServer::~RenderServer()
{
    stop();
}

juce::Result RenderServer::start()
{
    if (!listener.createListener(settings.port))
        return juce::Result::fail("Could not listen on port " + juce::String(settings.port));

    juce::Logger::writeToLog("Listening on port " + juce::String(settings.port));
    startThread();
    return juce::Result::ok();
}

void RenderServer::stop()
{
    signalThreadShouldExit();
    listener.close();
    stopThread(5000);
}

void RenderServer::run()
{
    while (!threadShouldExit())
    {
        if (listener.waitUntilReady(true, 250) <= 0)
            continue;

        std::unique_ptr<juce::StreamingSocket> connection(listener.waitForNextConnection());

        if (connection != nullptr && !threadShouldExit())
            handleConnection(*connection);
    }
}

void RenderServer::handleConnection(juce::StreamingSocket& connection)
{
    juce::MemoryBlock received;
    char buffer[4096];
    const juce::uint32 deadline = juce::Time::getMillisecondCounter() + (juce::uint32) requestTimeoutMs;

    while (juce::Time::getMillisecondCounter() < deadline && !threadShouldExit())
    {
        const int ready = connection.waitUntilReady(true, 250);

        if (ready < 0)
            return;

        if (ready == 0)
            continue;

        const int bytesRead = connection.read(buffer, (int) sizeof(buffer), false);

        if (bytesRead <= 0)
            return;

        received.append(buffer, (size_t) bytesRead);

        HttpRequest request;
        switch (HttpMessage::parseRequest(received, request))
        {
            case HttpMessage::ParseStatus::Incomplete:
                break;

            case HttpMessage::ParseStatus::Complete:
                sendResponse(connection, handleRequest(request));
                return;

            case HttpMessage::ParseStatus::Malformed:
                sendResponse(connection, HttpResponse::error(400, "Malformed request"));
                return;

            case HttpMessage::ParseStatus::TooLarge:
                sendResponse(connection, HttpResponse::error(413, "Request too large"));
                return;
        }
    }

    sendResponse(connection, HttpResponse::error(408, "Request timed out"));
}

void RenderServer::sendResponse(juce::StreamingSocket& connection, const HttpResponse& response)
{
    const auto data = HttpMessage::formatResponse(response);

    if (connection.write(data.getData(), (int) data.getSize()) != (int) data.getSize())
        juce::Logger::writeToLog("WARNING: could not send HTTP " + juce::String(response.statusCode) + " response");
}

//==============================================================================
HttpResponse RenderServer::handleRequest(const HttpRequest& request)
{
    if (request.path == "/health")
    {
        if (request.method != "GET")
            return HttpResponse::error(405, "Method not allowed");

        return handleHealth();
    }

    if (request.path == "/render")
    {
        if (request.method != "POST")
            return HttpResponse::error(405, "Method not allowed");

        return handleRender(request);
    }

    return HttpResponse::error(404, "Not found");
}

bool RenderServer::isAuthorised(const HttpRequest& request) const
{
    if (settings.workerToken.isEmpty())
        return true;

    return request.getHeader("authorization") == "Bearer " + settings.workerToken;
}

HttpResponse RenderServer::handleHealth()
{
    auto* object = new juce::DynamicObject();
    object->setProperty("status", "ok");
    object->setProperty("activeJobs", renderManager.getActiveJobCount());
    return HttpResponse::json(200, juce::var(object));
}

HttpResponse RenderServer::handleRender(const HttpRequest& request)
{
    // Rejected before any job state exists
    if (!isAuthorised(request))
        return HttpResponse::error(401, "Unauthorized");

    if (settings.internalSecret.isEmpty())
        return HttpResponse::error(500, "JWT_SECRET not configured on worker");

    RenderTypes::RenderJob job;
    auto parsed = parseRenderRequest(request.getBodyAsString(), job);

    if (parsed.failed())
        return HttpResponse::error(400, parsed.getErrorMessage());

    juce::String error;
    switch (renderManager.submit(job, error))
    {
        case RenderManager::SubmitStatus::Queued:
            break;

        case RenderManager::SubmitStatus::Invalid:      return HttpResponse::error(400, error);
        case RenderManager::SubmitStatus::Duplicate:    return HttpResponse::error(409, error);
        case RenderManager::SubmitStatus::ShuttingDown: return HttpResponse::error(503, error);
    }

    auto* object = new juce::DynamicObject();
    object->setProperty("status", "queued");
    object->setProperty("renderId", job.renderId);
    return HttpResponse::json(200, juce::var(object));
}

juce::Result RenderServer::parseRenderRequest(const juce::String& body, RenderTypes::RenderJob& job)
{
    juce::var json;
    auto parsed = juce::JSON::parse(body, json);

    if (parsed.failed())
        return juce::Result::fail("Request body is not valid JSON: " + parsed.getErrorMessage());

    if (!json.isObject())
        return juce::Result::fail("Request body must be a JSON object");

    RenderTypes::RenderJob result;
    result.renderId = json["renderId"].toString().trim();
    result.userId = json["userId"].toString().trim();
    result.payloadUrl = json["payloadUrl"].toString().trim();
    result.callbackUrl = json["callbackUrl"].toString().trim();

    auto validation = RenderManager::validateJob(result);
    if (validation.failed())
        return validation;

    job = result;
    return juce::Result::ok();
}
