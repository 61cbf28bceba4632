#include <gtest/gtest.h>
#include "TestFakes.h"
#include "delivery/PayloadClient.h"

using namespace storyreel_test;
using RenderTypes::AnimationType;

namespace {

juce::var parse(const juce::String& text) {
  juce::var json;
  EXPECT_TRUE(juce::JSON::parse(text, json).wasOk()) << text;
  return json;
}

// -----------------------------------------------------------------------------
// Storyboard items
// -----------------------------------------------------------------------------
TEST(PayloadClientTest, DurationFallsBackToFiveSeconds) {
  EXPECT_DOUBLE_EQ(PayloadClient::parseStoryboardItem(parse(R"({"assetId":"a"})"), 0).durationSec, 5.0);
  EXPECT_DOUBLE_EQ(PayloadClient::parseStoryboardItem(parse(R"({"durationSec":0})"), 0).durationSec, 5.0);
  EXPECT_DOUBLE_EQ(PayloadClient::parseStoryboardItem(parse(R"({"durationSec":-2})"), 0).durationSec, 5.0);
  EXPECT_DOUBLE_EQ(PayloadClient::parseStoryboardItem(parse(R"({"durationSec":"abc"})"), 0).durationSec, 5.0);
  EXPECT_DOUBLE_EQ(PayloadClient::parseStoryboardItem(parse(R"({"durationSec":"2.5"})"), 0).durationSec, 2.5);
  EXPECT_DOUBLE_EQ(PayloadClient::parseStoryboardItem(parse(R"({"durationSec":3})"), 0).durationSec, 3.0);
}

TEST(PayloadClientTest, AnimationPrecedence) {
  auto item = [](const char* text) { return PayloadClient::parseStoryboardItem(parse(text), 0).animation; };

  EXPECT_EQ(item(R"({"animateType":"pan-left","animation":"zoom-out","animate":true})"), AnimationType::PanLeft);
  EXPECT_EQ(item(R"({"animation":"zoom-out","animate":true})"), AnimationType::ZoomOut);
  EXPECT_EQ(item(R"({"animate":true})"), AnimationType::ZoomIn);
  EXPECT_EQ(item(R"({"animate":false})"), AnimationType::None);
  EXPECT_EQ(item(R"({"animateType":"spin"})"), AnimationType::None);
  EXPECT_EQ(item(R"({})"), AnimationType::None);
}

TEST(PayloadClientTest, NonStringAnimationMeansNoMotion) {
  auto item = [](const char* text) { return PayloadClient::parseStoryboardItem(parse(text), 0).animation; };

  EXPECT_EQ(item(R"({"animation":{"status":"completed"},"animate":true})"), AnimationType::None);
  EXPECT_EQ(item(R"({"animation":[1],"animate":true})"), AnimationType::None);
  EXPECT_EQ(item(R"({"animation":true,"animate":true})"), AnimationType::None);
  EXPECT_EQ(item(R"({"animation":{},"animate":true})"), AnimationType::ZoomIn);
  EXPECT_EQ(item(R"({"animation":null,"animate":true})"), AnimationType::ZoomIn);
}

TEST(PayloadClientTest, PositionIsTheStoryboardIndex) {
  const auto item = PayloadClient::parseStoryboardItem(parse(R"({"assetId":"img-7"})"), 4);
  EXPECT_EQ(item.position, 4);
  EXPECT_EQ(item.assetId, "img-7");
}

// -----------------------------------------------------------------------------
// Assets
// -----------------------------------------------------------------------------
TEST(PayloadClientTest, CompletedAnimationVideoWinsOverDataUrl) {
  RenderTypes::AssetSource source;
  ASSERT_TRUE(PayloadClient::parseAssetSource(
      parse(R"({"id":"a","dataUrl":"data:image/png;base64,AAAA",
                "animation":{"status":"completed","videoUrl":"https://v.example.com/a.mp4"}})"),
      source));

  const auto* video = std::get_if<RenderTypes::VideoLoopSource>(&source);
  ASSERT_NE(video, nullptr);
  EXPECT_EQ(video->videoUrl, "https://v.example.com/a.mp4");
}

TEST(PayloadClientTest, PendingAnimationFallsBackToImage) {
  RenderTypes::AssetSource source;
  ASSERT_TRUE(PayloadClient::parseAssetSource(
      parse(R"({"id":"a","dataUrl":"data:image/png;base64,AAAA",
                "animation":{"status":"processing","videoUrl":"https://v.example.com/a.mp4"}})"),
      source));

  EXPECT_TRUE(std::holds_alternative<RenderTypes::StillImageSource>(source));
}

TEST(PayloadClientTest, AssetWithoutUsableContentIsUnresolvable) {
  RenderTypes::AssetSource source;
  EXPECT_FALSE(PayloadClient::parseAssetSource(parse(R"({"id":"a"})"), source));
  EXPECT_FALSE(PayloadClient::parseAssetSource(
      parse(R"({"id":"a","animation":{"status":"completed","videoUrl":"ftp://x/a.mp4"}})"), source));
}

// -----------------------------------------------------------------------------
// Whole payloads
// -----------------------------------------------------------------------------
TEST(PayloadClientTest, ParsesPayloadAndDropsUnresolvableAssets) {
  RenderTypes::RenderPayload payload;
  const auto result = PayloadClient::parsePayload(parse(R"({
      "renderId":"r1","projectId":"p1","audioUrl":"  https://a.example.com/voice.mp3 ",
      "format":"vertical",
      "storyboard":[{"assetId":"a1","durationSec":2},{"assetId":"a2"}],
      "assets":[{"id":"a1","dataUrl":"data:image/png;base64,AAAA"},{"id":"a2"},{"dataUrl":"x"}]})"), payload);

  ASSERT_TRUE(result.wasOk());
  EXPECT_EQ(payload.renderId, "r1");
  EXPECT_EQ(payload.projectId, "p1");
  EXPECT_EQ(payload.audioUrl, "https://a.example.com/voice.mp3");
  EXPECT_EQ(payload.format, "vertical");
  EXPECT_TRUE(payload.quality.isEmpty());
  ASSERT_EQ(payload.storyboard.size(), 2u);
  EXPECT_EQ(payload.storyboard[1].position, 1);
  EXPECT_EQ(payload.assets.size(), 1u);
  EXPECT_EQ(payload.assets.count("a1"), 1u);
}

TEST(PayloadClientTest, NonObjectPayloadFails) {
  RenderTypes::RenderPayload payload;
  EXPECT_TRUE(PayloadClient::parsePayload(parse("[1,2]"), payload).failed());
}

TEST(PayloadClientTest, FetchPostsIdsWithSharedSecret) {
  FakeHttpClient http;
  http.setResponse("https://web.example.com/payload", 200, R"({"renderId":"r1","storyboard":[]})");
  PayloadClient client(http, "s3cret");

  RenderTypes::RenderJob job { "r1", "u1", "https://web.example.com/payload", "https://web.example.com/cb" };
  RenderTypes::RenderPayload payload;

  ASSERT_TRUE(client.fetch(job, payload).wasOk());

  const auto requests = http.getSentRequests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "POST");
  EXPECT_EQ(requests[0].headers[RenderTypes::internalSecretHeader], "s3cret");

  juce::var body;
  ASSERT_TRUE(juce::JSON::parse(requests[0].body.toString(), body).wasOk());
  EXPECT_EQ(body["userId"].toString(), "u1");
  EXPECT_EQ(body["renderId"].toString(), "r1");
}

TEST(PayloadClientTest, FetchFailsOnHttpErrorOrBadJson) {
  FakeHttpClient http;
  http.setResponse("https://web.example.com/forbidden", 403, "{}");
  http.setResponse("https://web.example.com/garbage", 200, "<html>");
  PayloadClient client(http, "s");

  RenderTypes::RenderPayload payload;
  RenderTypes::RenderJob job { "r1", "u1", "https://web.example.com/forbidden", "cb" };

  const auto forbidden = client.fetch(job, payload);
  EXPECT_TRUE(forbidden.failed());
  EXPECT_TRUE(forbidden.getErrorMessage().contains("HTTP 403"));

  job.payloadUrl = "https://web.example.com/garbage";
  EXPECT_TRUE(client.fetch(job, payload).failed());

  job.payloadUrl = "https://web.example.com/unreachable";
  EXPECT_TRUE(client.fetch(job, payload).failed());
}

}  // namespace
