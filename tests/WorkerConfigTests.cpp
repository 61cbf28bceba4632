#include <gtest/gtest.h>
#include "core/WorkerConfig.h"

namespace {

WorkerConfig loadFrom(const std::map<juce::String, juce::String>& variables) {
  return WorkerConfig::load([&variables](const juce::String& name) {
    auto found = variables.find(name);
    return found != variables.end() ? found->second : juce::String();
  });
}

// -----------------------------------------------------------------------------
// Environment
// -----------------------------------------------------------------------------
TEST(WorkerConfigTest, DefaultsWhenNothingIsSet) {
  const auto config = loadFrom({});

  EXPECT_EQ(config.port, 8000);
  EXPECT_EQ(config.workspaceRoot, juce::File("/tmp/work"));
  EXPECT_EQ(config.formatName, "horizontal");
  EXPECT_EQ(config.qualityName, "standard");
  EXPECT_FALSE(config.useNvidiaAcceleration);
  EXPECT_EQ(config.staleWorkspaceHours, 24);
  EXPECT_TRUE(config.validate().wasOk());
}

TEST(WorkerConfigTest, ReadsServiceAndStorageVariables) {
  const auto config = loadFrom({ { "PORT", "9100" },
                                 { "WORKSPACE_ROOT", "/var/storyreel" },
                                 { "RENDER_TOKEN", "tok" },
                                 { "JWT_SECRET", "shh" },
                                 { "R2_ACCOUNT_ID", "acct" },
                                 { "R2_BUCKET", "bucket" },
                                 { "R2_PUBLIC_BASE_URL", "https://media.example.com" },
                                 { "R2_ACCESS_KEY_ID", "id" },
                                 { "R2_SECRET_ACCESS_KEY", "key" },
                                 { "RENDER_USE_NVENC", "true" } });

  EXPECT_EQ(config.port, 9100);
  EXPECT_EQ(config.workspaceRoot, juce::File("/var/storyreel"));
  EXPECT_EQ(config.workerToken, "tok");
  EXPECT_EQ(config.internalSecret, "shh");
  EXPECT_EQ(config.storage.endpoint, "https://acct.r2.cloudflarestorage.com");
  EXPECT_TRUE(config.storage.getMissingFields().isEmpty());
  EXPECT_TRUE(config.useNvidiaAcceleration);
  EXPECT_TRUE(config.describeWarnings().isEmpty());
}

TEST(WorkerConfigTest, ExplicitEndpointWinsOverAccountId) {
  const auto config = loadFrom({ { "R2_ENDPOINT", "https://minio.local:9000" }, { "R2_ACCOUNT_ID", "acct" } });
  EXPECT_EQ(config.storage.endpoint, "https://minio.local:9000");
}

TEST(WorkerConfigTest, AsrTokenIsTheFallbackBearerToken) {
  EXPECT_EQ(loadFrom({ { "ASR_TOKEN", "legacy" } }).workerToken, "legacy");
  EXPECT_EQ(loadFrom({ { "ASR_TOKEN", "legacy" }, { "RENDER_TOKEN", "new" } }).workerToken, "new");
}

TEST(WorkerConfigTest, ReadsClipEncoderOptions) {
  const auto config = loadFrom({ { "RENDER_NVENC_PARAMS", "-preset p7 -qp 18" }, { "RENDER_X264_PARAMS", "-preset slow -crf 16" } });
  EXPECT_EQ(config.clipNvidiaParams, "-preset p7 -qp 18");
  EXPECT_EQ(config.clipCpuParams, "-preset slow -crf 16");
  EXPECT_TRUE(loadFrom({}).clipCpuParams.isEmpty());
}

TEST(WorkerConfigTest, RenderTokenAloneEnablesBearerAuth) {
  const auto config = loadFrom({ { "RENDER_TOKEN", "t" } });
  EXPECT_EQ(config.workerToken, "t");
}

TEST(WorkerConfigTest, MissingSecretAndStorageAreWarnings) {
  const auto config = loadFrom({});
  const auto warnings = config.describeWarnings();

  EXPECT_EQ(warnings.size(), 2);
  EXPECT_TRUE(warnings[0].contains("JWT_SECRET"));
  EXPECT_TRUE(config.validate().wasOk());
}

TEST(WorkerConfigTest, InvalidValuesFailValidation) {
  EXPECT_TRUE(loadFrom({ { "PORT", "http" } }).validate().failed());
  EXPECT_TRUE(loadFrom({ { "RENDER_FORMAT", "portrait" } }).validate().failed());
  EXPECT_TRUE(loadFrom({ { "RENDER_QUALITY", "ultra" } }).validate().failed());
}

// -----------------------------------------------------------------------------
// Command line
// -----------------------------------------------------------------------------
TEST(WorkerConfigTest, ArgumentsOverrideEnvironment) {
  auto config = loadFrom({ { "PORT", "9100" }, { "RENDER_FORMAT", "square" } });

  juce::ArgumentList arguments("storyreel-worker",
                               juce::StringArray { "--port=9200", "--format=vertical", "--quality=pro", "--nvenc" });
  config.applyArguments(arguments);

  EXPECT_EQ(config.port, 9200);
  EXPECT_EQ(config.getOutputFormat(), RenderTypes::OutputFormat::Vertical);
  EXPECT_EQ(config.getQualityPreset(), RenderTypes::QualityPreset::Pro);
  EXPECT_TRUE(config.useNvidiaAcceleration);
}

// -----------------------------------------------------------------------------
// Parsing helpers
// -----------------------------------------------------------------------------
TEST(WorkerConfigTest, PortParsing) {
  EXPECT_EQ(WorkerConfig::parsePort("8000"), 8000);
  EXPECT_EQ(WorkerConfig::parsePort(" 65535 "), 65535);
  EXPECT_EQ(WorkerConfig::parsePort("0"), -1);
  EXPECT_EQ(WorkerConfig::parsePort("65536"), -1);
  EXPECT_EQ(WorkerConfig::parsePort("-1"), -1);
  EXPECT_EQ(WorkerConfig::parsePort("80a"), -1);
  EXPECT_EQ(WorkerConfig::parsePort(""), -1);
}

TEST(WorkerConfigTest, TruthyValues) {
  for (auto* text : { "1", "true", "TRUE", "yes", "On" })
    EXPECT_TRUE(WorkerConfig::isTruthy(text)) << text;

  for (auto* text : { "", "0", "false", "no", "enabled" })
    EXPECT_FALSE(WorkerConfig::isTruthy(text)) << text;
}

}  // namespace
