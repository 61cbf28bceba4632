#include <gtest/gtest.h>
#include "TestFakes.h"
#include "server/RenderServer.h"

using namespace storyreel_test;

namespace {

const char* validBody =
    R"({"renderId":"r1","userId":"u1","payloadUrl":"https://web.example.com/payload",)"
    R"("callbackUrl":"https://web.example.com/callback"})";

HttpRequest makeRequest(const juce::String& method, const juce::String& path, const juce::String& body = {}) {
  HttpRequest request;
  request.method = method;
  request.path = path;
  request.body = juce::MemoryBlock(body.toRawUTF8(), body.getNumBytesAsUTF8());
  return request;
}

class RenderServerTest : public ::testing::Test {
 protected:
  RenderServerTest() {
    environment.workspaces = &workspaces;
    environment.httpClient = &http;
    environment.storage = &storage;
    environment.notifier = &notifier;
    environment.internalSecret = "secret";
    environment.createExecutor = [this] { return std::make_unique<FakeFFmpegExecutor>(tools); };
  }

  RenderServer::Settings settingsWith(const juce::String& token, const juce::String& secret) {
    RenderServer::Settings settings;
    settings.workerToken = token;
    settings.internalSecret = secret;
    return settings;
  }

  ScopedTempDirectory temp;
  WorkspaceManager workspaces { temp.get().getChildFile("work") };
  FakeHttpClient http;
  FakeObjectStorage storage;
  FakeNotifier notifier;
  std::shared_ptr<FakeToolState> tools = std::make_shared<FakeToolState>();
  RenderEnvironment environment;
};

// -----------------------------------------------------------------------------
// Routing
// -----------------------------------------------------------------------------
TEST_F(RenderServerTest, HealthReportsActiveJobs) {
  RenderManager manager(environment);
  RenderServer server(manager, settingsWith({}, "secret"));

  const auto response = server.handleRequest(makeRequest("GET", "/health"));
  EXPECT_EQ(response.statusCode, 200);
  EXPECT_EQ(response.body["status"].toString(), "ok");
  EXPECT_EQ((int) response.body["activeJobs"], 0);
}

TEST_F(RenderServerTest, UnknownPathsAndMethods) {
  RenderManager manager(environment);
  RenderServer server(manager, settingsWith({}, "secret"));

  EXPECT_EQ(server.handleRequest(makeRequest("GET", "/nope")).statusCode, 404);
  EXPECT_EQ(server.handleRequest(makeRequest("POST", "/health")).statusCode, 405);
  EXPECT_EQ(server.handleRequest(makeRequest("GET", "/render")).statusCode, 405);
}

// -----------------------------------------------------------------------------
// POST /render
// -----------------------------------------------------------------------------
TEST_F(RenderServerTest, RejectsMissingOrWrongBearerToken) {
  RenderManager manager(environment);
  RenderServer server(manager, settingsWith("tok", "secret"));

  auto request = makeRequest("POST", "/render", validBody);
  EXPECT_EQ(server.handleRequest(request).statusCode, 401);

  request.headers.set("authorization", "Bearer wrong");
  EXPECT_EQ(server.handleRequest(request).statusCode, 401);
  EXPECT_EQ(manager.getActiveJobCount(), 0);
}

TEST_F(RenderServerTest, MissingSecretIsAServerError) {
  RenderManager manager(environment);
  RenderServer server(manager, settingsWith({}, {}));

  const auto response = server.handleRequest(makeRequest("POST", "/render", validBody));
  EXPECT_EQ(response.statusCode, 500);
  EXPECT_EQ(response.body["error"].toString(), "JWT_SECRET not configured on worker");
}

TEST_F(RenderServerTest, BadBodiesAreRejected) {
  RenderManager manager(environment);
  RenderServer server(manager, settingsWith({}, "secret"));

  EXPECT_EQ(server.handleRequest(makeRequest("POST", "/render", "{not json")).statusCode, 400);
  EXPECT_EQ(server.handleRequest(makeRequest("POST", "/render", "[]")).statusCode, 400);

  const auto response = server.handleRequest(makeRequest("POST", "/render", R"({"renderId":"r1"})"));
  EXPECT_EQ(response.statusCode, 400);
  EXPECT_TRUE(response.body["error"].toString().contains("userId"));
  EXPECT_TRUE(notifier.getReports().empty());
}

TEST_F(RenderServerTest, AcceptedJobIsQueuedAndReportsOnce) {
  RenderManager manager(environment);
  RenderServer server(manager, settingsWith("tok", "secret"));

  auto request = makeRequest("POST", "/render", validBody);
  request.headers.set("authorization", "Bearer tok");

  const auto response = server.handleRequest(request);
  EXPECT_EQ(response.statusCode, 200);
  EXPECT_EQ(response.body["status"].toString(), "queued");
  EXPECT_EQ(response.body["renderId"].toString(), "r1");

  // The payload endpoint is unreachable in this fixture, so the job fails on its own
  RenderTypes::CallbackReport report;
  ASSERT_TRUE(manager.waitForJob("r1", 10000, report));
  EXPECT_FALSE(report.complete);
  EXPECT_EQ(notifier.getReports().size(), 1u);
}

TEST_F(RenderServerTest, ParseRenderRequestTrimsFields) {
  RenderTypes::RenderJob job;
  const auto result = RenderServer::parseRenderRequest(
      R"({"renderId":" r9 ","userId":"u","payloadUrl":"https://p","callbackUrl":"https://c","extra":1})", job);

  ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
  EXPECT_EQ(job.renderId, "r9");
  EXPECT_EQ(job.callbackUrl, "https://c");
}

// -----------------------------------------------------------------------------
// Over a real socket
// -----------------------------------------------------------------------------
TEST_F(RenderServerTest, ServesHealthOverTcp) {
  RenderManager manager(environment);
  std::unique_ptr<RenderServer> server;

  for (int port = 38100; port < 38120 && server == nullptr; ++port) {
    auto settings = settingsWith({}, "secret");
    settings.port = port;
    auto candidate = std::make_unique<RenderServer>(manager, settings);

    if (candidate->start().wasOk())
      server = std::move(candidate);
  }

  ASSERT_NE(server, nullptr) << "no free port";

  juce::StreamingSocket client;
  ASSERT_TRUE(client.connect("127.0.0.1", server->getPort(), 2000));

  const juce::String request = "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n";
  ASSERT_EQ(client.write(request.toRawUTF8(), (int) request.getNumBytesAsUTF8()), (int) request.getNumBytesAsUTF8());

  juce::MemoryBlock received;
  char buffer[1024];

  for (;;) {
    if (client.waitUntilReady(true, 2000) != 1)
      break;

    const int bytesRead = client.read(buffer, (int) sizeof(buffer), false);
    if (bytesRead <= 0)
      break;

    received.append(buffer, (size_t) bytesRead);
  }

  EXPECT_TRUE(received.toString().startsWith("HTTP/1.1 200 OK"));
  EXPECT_TRUE(received.toString().contains("\"status\": \"ok\""));

  server->stop();
}

}  // namespace
