#include "PayloadClient.h"

namespace
{
    // Empty strings, objects and arrays, zero, false and null count as absent
    bool hasValue(const juce::var& value)
    {
        if (value.isVoid() || value.isUndefined())
            return false;

        if (value.isString())
            return value.toString().trim().isNotEmpty();

        if (value.isArray())
            return value.size() > 0;

        if (auto* object = value.getDynamicObject())
            return object->getProperties().size() > 0;

        return (bool) value;
    }
}

PayloadClient::PayloadClient(HttpClient& httpClient, const juce::String& internalSecret)
    : httpClient(httpClient),
      internalSecret(internalSecret)
{
}

juce::Result PayloadClient::fetch(const RenderTypes::RenderJob& job, RenderTypes::RenderPayload& payload)
{
    auto* body = new juce::DynamicObject();
    body->setProperty("userId", job.userId);
    body->setProperty("renderId", job.renderId);

    auto request = HttpClient::makeJsonPost(juce::URL(job.payloadUrl), juce::var(body), timeoutMs);
    request.headers.set(RenderTypes::internalSecretHeader, internalSecret);

    HttpClient::Response response;
    auto result = httpClient.send(request, response);

    if (result.failed())
        return juce::Result::fail("Payload request failed: " + result.getErrorMessage());

    if (!response.isSuccess())
        return juce::Result::fail("Payload request failed: HTTP " + juce::String(response.statusCode));

    juce::var json;
    auto parsed = juce::JSON::parse(response.getBodyAsString(), json);
    if (parsed.failed())
        return juce::Result::fail("Payload is not valid JSON: " + parsed.getErrorMessage());

    return parsePayload(json, payload);
}

juce::Result PayloadClient::parsePayload(const juce::var& json, RenderTypes::RenderPayload& payload)
{
    if (!json.isObject())
        return juce::Result::fail("Payload is not a JSON object");

    payload = RenderTypes::RenderPayload();
    payload.renderId = json["renderId"].toString();
    payload.projectId = json["projectId"].toString();
    payload.audioUrl = json["audioUrl"].toString().trim();
    payload.format = json["format"].toString();
    payload.quality = json["quality"].toString();

    if (const auto* storyboard = json["storyboard"].getArray())
    {
        for (int i = 0; i < storyboard->size(); ++i)
            payload.storyboard.push_back(parseStoryboardItem(storyboard->getReference(i), i));
    }

    if (const auto* assets = json["assets"].getArray())
    {
        for (const auto& asset : *assets)
        {
            const juce::String id = asset["id"].toString();
            RenderTypes::AssetSource source;

            if (id.isNotEmpty() && parseAssetSource(asset, source))
                payload.assets.insert_or_assign(id, source);
        }
    }

    return juce::Result::ok();
}

RenderTypes::StoryboardItem PayloadClient::parseStoryboardItem(const juce::var& item, int position)
{
    RenderTypes::StoryboardItem result;
    result.position = position;
    result.assetId = item["assetId"].toString();

    const juce::var& duration = item["durationSec"];
    const double seconds = duration.isString() ? duration.toString().getDoubleValue() : (double) duration;
    result.durationSec = (std::isfinite(seconds) && seconds > 0.0) ? seconds : defaultItemDuration;

    const juce::String animateType = item["animateType"].toString().trim();
    const juce::var& animation = item["animation"];

    if (animateType.isNotEmpty())
        result.animation = RenderTypes::animationFromName(animateType);
    else if (animation.isString() && hasValue(animation))
        result.animation = RenderTypes::animationFromName(animation.toString());
    else if (hasValue(animation))
        result.animation = RenderTypes::AnimationType::None;
    else
        result.animation = (bool) item["animate"] ? RenderTypes::AnimationType::ZoomIn
                                                  : RenderTypes::AnimationType::None;

    return result;
}

bool PayloadClient::parseAssetSource(const juce::var& asset, RenderTypes::AssetSource& source)
{
    const juce::var& animation = asset["animation"];

    if (animation.isObject() && animation["status"].toString() == "completed")
    {
        const juce::String videoUrl = animation["videoUrl"].toString().trim();

        if (videoUrl.startsWith("http"))
        {
            source = RenderTypes::VideoLoopSource { videoUrl };
            return true;
        }
    }

    const juce::String dataUrl = asset["dataUrl"].toString();

    if (dataUrl.isNotEmpty())
    {
        source = RenderTypes::StillImageSource { dataUrl };
        return true;
    }

    return false;
}
