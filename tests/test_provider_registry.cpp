#include <gtest/gtest.h>

#include "providerRegistry.hpp"

#include <stdexcept>

namespace
{

EndpointSpec spec(ProviderKind kind, const std::string &url)
{
  EndpointSpec s;
  s.kind = kind;
  s.baseUrl = url;
  s.encodings = {AudioEncoding::Wav};
  return s;
}

}

TEST(BaseUrl, ParsesSchemeHostPortAndPath)
{
  BaseUrl url = parseBaseUrl("http://127.0.0.1:8880/v1/");
  EXPECT_EQ(url.scheme, "http");
  EXPECT_EQ(url.host, "127.0.0.1");
  EXPECT_EQ(url.port, 8880);
  EXPECT_EQ(url.path, "/v1");
  EXPECT_EQ(url.origin(), "http://127.0.0.1:8880");

  BaseUrl https = parseBaseUrl("https://api.openai.com/v1");
  EXPECT_EQ(https.port, 443);
  EXPECT_EQ(https.origin(), "https://api.openai.com:443");

  BaseUrl bare = parseBaseUrl("http://whisper.local");
  EXPECT_EQ(bare.port, 80);
  EXPECT_EQ(bare.path, "");

  BaseUrl v6 = parseBaseUrl("http://[::1]:2022/v1");
  EXPECT_EQ(v6.host, "::1");
  EXPECT_EQ(v6.port, 2022);
}

TEST(BaseUrl, RejectsMalformedUrls)
{
  EXPECT_THROW(parseBaseUrl("localhost:8880"), std::invalid_argument);
  EXPECT_THROW(parseBaseUrl("ftp://host/v1"), std::invalid_argument);
  EXPECT_THROW(parseBaseUrl("http:///v1"), std::invalid_argument);
  EXPECT_THROW(parseBaseUrl("http://host:port/v1"), std::invalid_argument);
}

TEST(BaseUrl, LocalHostsAreRecognized)
{
  EXPECT_TRUE(isLocalUrl("http://localhost:8880/v1"));
  EXPECT_TRUE(isLocalUrl("http://127.0.0.1:2022/v1"));
  EXPECT_TRUE(isLocalUrl("http://[::1]:2022/v1"));
  EXPECT_TRUE(isLocalUrl("http://192.168.1.20:8880/v1"));
  EXPECT_TRUE(isLocalUrl("http://10.0.0.5/v1"));
  EXPECT_TRUE(isLocalUrl("http://172.20.0.2/v1"));
  EXPECT_TRUE(isLocalUrl("http://kokoro.local/v1"));

  EXPECT_FALSE(isLocalUrl("http://172.32.0.2/v1"));
  EXPECT_FALSE(isLocalUrl("https://api.openai.com/v1"));
  EXPECT_FALSE(isLocalUrl("not a url"));
}

TEST(AudioEncoding, ParsesNamesCaseInsensitively)
{
  EXPECT_EQ(parseEncoding("MP3"), AudioEncoding::Mp3);
  EXPECT_EQ(parseEncoding("opus"), AudioEncoding::Opus);
  EXPECT_FALSE(parseEncoding("vorbis").has_value());
  EXPECT_TRUE(isCompressed(AudioEncoding::Flac));
  EXPECT_FALSE(isCompressed(AudioEncoding::Wav));
}

TEST(ProviderRegistry, KeepsRegistrationOrderPerKind)
{
  ProviderRegistry registry;
  registry.add(spec(ProviderKind::Tts, "http://127.0.0.1:8880/v1"));
  registry.add(spec(ProviderKind::Stt, "http://127.0.0.1:2022/v1/"));
  registry.add(spec(ProviderKind::Tts, "https://api.openai.com/v1"));
  registry.add(spec(ProviderKind::Stt, "https://api.openai.com/v1"));

  EXPECT_EQ(registry.size(), 4u);

  auto tts = registry.endpoints(ProviderKind::Tts);
  ASSERT_EQ(tts.size(), 2u);
  EXPECT_EQ(tts[0]->priority, 0);
  EXPECT_EQ(tts[0]->baseUrl, "http://127.0.0.1:8880/v1");
  EXPECT_TRUE(tts[0]->isLocal);
  EXPECT_EQ(tts[1]->priority, 1);
  EXPECT_FALSE(tts[1]->isLocal);

  auto stt = registry.endpoints(ProviderKind::Stt);
  ASSERT_EQ(stt.size(), 2u);
  EXPECT_EQ(stt[0]->baseUrl, "http://127.0.0.1:2022/v1");
  EXPECT_EQ(stt[1]->priority, 1);
}

TEST(ProviderRegistry, LocalOverrideWins)
{
  ProviderRegistry registry;
  EndpointSpec s = spec(ProviderKind::Stt, "https://gpu-box.example.com/v1");
  s.localOverride = true;
  EXPECT_TRUE(registry.add(s).isLocal);
}

TEST(ProviderRegistry, StatusIsRecorded)
{
  ProviderRegistry registry;
  const ProviderEndpoint &endpoint = registry.add(spec(ProviderKind::Tts, "http://127.0.0.1:8880/v1"));
  EXPECT_EQ(endpoint.status.load(), EndpointStatus::Unknown);

  registry.recordStatus(endpoint, EndpointStatus::Unreachable);
  EXPECT_EQ(endpoint.status.load(), EndpointStatus::Unreachable);
  registry.recordStatus(endpoint, EndpointStatus::Ok);
  EXPECT_EQ(endpoint.status.load(), EndpointStatus::Ok);
}

TEST(ProviderRegistry, RejectsInvalidUrl)
{
  ProviderRegistry registry;
  EXPECT_THROW(registry.add(spec(ProviderKind::Tts, "8880")), std::invalid_argument);
  EXPECT_EQ(registry.size(), 0u);
}
