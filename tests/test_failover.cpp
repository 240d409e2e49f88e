#include <gtest/gtest.h>

#include "failoverExecutor.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <string>

namespace
{

const std::string LOCAL_TTS = "http://127.0.0.1:8880/v1";
const std::string REMOTE_TTS = "https://api.openai.com/v1";
const std::string LOCAL_STT = "http://127.0.0.1:2022/v1";
const std::string REMOTE_STT = "https://stt.example.com/v1";

struct Rig
{
  ProviderRegistry registry;
  FakeSpeechClient client;
  FakeCodec codec;

  Rig()
  {
    add(ProviderKind::Tts, LOCAL_TTS, {AudioEncoding::Pcm, AudioEncoding::Wav, AudioEncoding::Mp3});
    add(ProviderKind::Tts, REMOTE_TTS, {AudioEncoding::Mp3, AudioEncoding::Opus, AudioEncoding::Wav});
    add(ProviderKind::Stt, LOCAL_STT, {AudioEncoding::Wav, AudioEncoding::Mp3});
    add(ProviderKind::Stt, REMOTE_STT, {AudioEncoding::Wav, AudioEncoding::Mp3, AudioEncoding::Opus});
  }

  const ProviderEndpoint &add(ProviderKind kind, const std::string &url, std::vector<AudioEncoding> encodings)
  {
    EndpointSpec spec;
    spec.kind = kind;
    spec.baseUrl = url;
    spec.voice = kind == ProviderKind::Tts ? "af_sky" : "";
    spec.model = kind == ProviderKind::Tts ? "tts-1" : "whisper-1";
    spec.language = kind == ProviderKind::Stt ? "en" : "";
    spec.encodings = std::move(encodings);
    return registry.add(spec);
  }

  const ProviderEndpoint &endpoint(ProviderKind kind, size_t index) { return *registry.endpoints(kind).at(index); }

  long count(const std::string &call) const
  {
    std::vector<std::string> calls = client.calls();
    return std::count(calls.begin(), calls.end(), call);
  }
};

SynthesisOptions hello()
{
  SynthesisOptions options;
  options.text = "Hello";
  return options;
}

PcmAudio capture()
{
  PcmAudio audio;
  audio.samples.assign(16000, kSpeechLevel);
  audio.sampleRate = 16000;
  return audio;
}

}

TEST(FailoverExecutor, FirstHealthyEndpointWins)
{
  Rig rig;
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  SynthesisOutcome outcome = executor.synthesize(hello());
  EXPECT_EQ(outcome.endpoint->baseUrl, LOCAL_TTS);
  EXPECT_EQ(outcome.format, AudioEncoding::Pcm);
  EXPECT_EQ(outcome.voice, "af_sky");
  EXPECT_EQ(outcome.audio.sampleRate, kSpeechPcmRate);
  EXPECT_EQ(outcome.audio.samples.size(), samplesFor(kSpeechPcmRate, 1000));
  ASSERT_EQ(outcome.attempts.size(), 1u);
  EXPECT_EQ(outcome.attempts[0].outcome, AttemptOutcome::Ok);
  EXPECT_EQ(rig.client.calls(), std::vector<std::string>{"tts " + LOCAL_TTS});
}

TEST(FailoverExecutor, PromptWithInvalidUtf8IsStillSynthesized)
{
  Rig rig;
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  SynthesisOptions options;
  options.text = "caf\xe9";
  SynthesisOutcome outcome = executor.synthesize(options);
  EXPECT_EQ(outcome.endpoint->baseUrl, LOCAL_TTS);
  ASSERT_EQ(rig.client.speechBodies().size(), 1u);
  EXPECT_NE(rig.client.speechBodies()[0].find("\"input\":\"caf\xef\xbf\xbd\""), std::string::npos);
}

TEST(FailoverExecutor, UnreachableEndpointFallsThroughToNext)
{
  Rig rig;
  rig.client.fail(LOCAL_TTS, AttemptOutcome::Unreachable);
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  SynthesisOutcome outcome = executor.synthesize(hello());
  EXPECT_EQ(outcome.endpoint->baseUrl, REMOTE_TTS);
  EXPECT_EQ(outcome.format, AudioEncoding::Mp3);
  EXPECT_FALSE(outcome.audio.samples.empty());

  ASSERT_EQ(outcome.attempts.size(), 2u);
  EXPECT_EQ(outcome.attempts[0].baseUrl, LOCAL_TTS);
  EXPECT_EQ(outcome.attempts[0].outcome, AttemptOutcome::Unreachable);
  EXPECT_EQ(outcome.attempts[1].outcome, AttemptOutcome::Ok);

  EXPECT_EQ(rig.endpoint(ProviderKind::Tts, 0).status.load(), EndpointStatus::Unreachable);
  EXPECT_EQ(rig.endpoint(ProviderKind::Tts, 1).status.load(), EndpointStatus::Ok);
}

TEST(FailoverExecutor, LocalEndpointIsTriedAgainOnLaterCalls)
{
  Rig rig;
  rig.client.fail(LOCAL_TTS, AttemptOutcome::Timeout);
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);
  FailureMemo memo;

  executor.synthesize(hello(), &memo);
  EXPECT_EQ(memo.size(), 0u);

  rig.client.recover(LOCAL_TTS);
  SynthesisOutcome second = executor.synthesize(hello(), &memo);
  EXPECT_EQ(second.endpoint->baseUrl, LOCAL_TTS);
  EXPECT_EQ(rig.count("tts " + LOCAL_TTS), 2);
}

TEST(FailoverExecutor, FailedRemoteEndpointIsSkippedForTheConversation)
{
  Rig rig;
  rig.client.fail(LOCAL_STT, AttemptOutcome::Timeout);
  rig.client.fail(REMOTE_STT, AttemptOutcome::BadResponse);
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);
  FailureMemo memo;

  EXPECT_THROW(executor.transcribe(capture(), "", &memo), AllEndpointsFailed);
  EXPECT_EQ(memo.size(), 1u);

  rig.client.recover(REMOTE_STT);
  try
  {
    executor.transcribe(capture(), "", &memo);
    FAIL() << "expected AllEndpointsFailed";
  }
  catch (const AllEndpointsFailed &e)
  {
    ASSERT_EQ(e.attempts().size(), 2u);
    EXPECT_EQ(e.attempts()[0].outcome, AttemptOutcome::Timeout);
    EXPECT_EQ(e.attempts()[1].outcome, AttemptOutcome::Skipped);
  }
  EXPECT_EQ(rig.count("stt " + LOCAL_STT), 2);
  EXPECT_EQ(rig.count("stt " + REMOTE_STT), 1);

  // A new conversation starts with a clean memo.
  FailureMemo fresh;
  TranscriptionOutcome outcome = executor.transcribe(capture(), "", &fresh);
  EXPECT_EQ(outcome.endpoint->baseUrl, REMOTE_STT);
}

TEST(FailoverExecutor, AllEndpointsFailedListsEveryEndpoint)
{
  Rig rig;
  rig.client.fail(LOCAL_TTS, AttemptOutcome::Unreachable);
  rig.client.fail(REMOTE_TTS, AttemptOutcome::Timeout);
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  try
  {
    executor.synthesize(hello());
    FAIL() << "expected AllEndpointsFailed";
  }
  catch (const AllEndpointsFailed &e)
  {
    ASSERT_EQ(e.attempts().size(), 2u);
    EXPECT_EQ(e.attempts()[0].baseUrl, LOCAL_TTS);
    EXPECT_EQ(e.attempts()[1].baseUrl, REMOTE_TTS);
    EXPECT_EQ(e.attempts()[1].outcome, AttemptOutcome::Timeout);
    std::string message = e.what();
    EXPECT_NE(message.find(LOCAL_TTS + " -> unreachable"), std::string::npos);
    EXPECT_NE(message.find(REMOTE_TTS + " -> timeout"), std::string::npos);
  }
}

TEST(FailoverExecutor, NoEndpointsConfigured)
{
  ProviderRegistry registry;
  FakeSpeechClient client;
  FakeCodec codec;
  FailoverExecutor executor(registry, client, codec);

  try
  {
    executor.transcribe(capture(), "");
    FAIL() << "expected AllEndpointsFailed";
  }
  catch (const AllEndpointsFailed &e)
  {
    EXPECT_TRUE(e.attempts().empty());
    EXPECT_NE(std::string(e.what()).find("no endpoints configured"), std::string::npos);
  }
}

TEST(FailoverExecutor, SpeechFormatPrefersRawLocallyAndCompressedRemotely)
{
  Rig rig;
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  EXPECT_EQ(executor.negotiateSpeechFormat(rig.endpoint(ProviderKind::Tts, 0)), AudioEncoding::Pcm);
  EXPECT_EQ(executor.negotiateSpeechFormat(rig.endpoint(ProviderKind::Tts, 1)), AudioEncoding::Mp3);

  rig.codec.unsupported = {AudioEncoding::Mp3};
  EXPECT_EQ(executor.negotiateSpeechFormat(rig.endpoint(ProviderKind::Tts, 1)), AudioEncoding::Opus);
}

TEST(FailoverExecutor, UploadFormatFollowsCompressionPolicy)
{
  Rig rig;
  const ProviderEndpoint &local = rig.endpoint(ProviderKind::Stt, 0);
  const ProviderEndpoint &remote = rig.endpoint(ProviderKind::Stt, 1);

  FailoverExecutor automatic(rig.registry, rig.client, rig.codec, CompressionPolicy::Auto);
  EXPECT_EQ(automatic.negotiateUploadFormat(local), AudioEncoding::Wav);
  EXPECT_EQ(automatic.negotiateUploadFormat(remote), AudioEncoding::Mp3);

  FailoverExecutor always(rig.registry, rig.client, rig.codec, CompressionPolicy::Always);
  EXPECT_EQ(always.negotiateUploadFormat(local), AudioEncoding::Mp3);

  FailoverExecutor never(rig.registry, rig.client, rig.codec, CompressionPolicy::Never);
  EXPECT_EQ(never.negotiateUploadFormat(remote), AudioEncoding::Wav);
}

TEST(FailoverExecutor, EndpointWithoutCommonFormatIsSkipped)
{
  Rig rig;
  ProviderRegistry registry;
  EndpointSpec pcmOnly;
  pcmOnly.kind = ProviderKind::Stt;
  pcmOnly.baseUrl = "http://127.0.0.1:9000/v1";
  pcmOnly.encodings = {AudioEncoding::Pcm};
  registry.add(pcmOnly);
  EndpointSpec wav = pcmOnly;
  wav.baseUrl = "http://127.0.0.1:9001/v1";
  wav.encodings = {AudioEncoding::Wav};
  registry.add(wav);

  FailoverExecutor executor(registry, rig.client, rig.codec);
  TranscriptionOutcome outcome = executor.transcribe(capture(), "");

  ASSERT_EQ(outcome.attempts.size(), 2u);
  EXPECT_EQ(outcome.attempts[0].outcome, AttemptOutcome::Skipped);
  EXPECT_EQ(outcome.endpoint->baseUrl, wav.baseUrl);
  EXPECT_EQ(rig.count("stt " + pcmOnly.baseUrl), 0);
}

TEST(FailoverExecutor, UploadIsEncodedForTheChosenFormat)
{
  Rig rig;
  rig.client.fail(LOCAL_STT, AttemptOutcome::Unreachable);
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  TranscriptionOutcome outcome = executor.transcribe(capture(), "de");
  EXPECT_EQ(outcome.format, AudioEncoding::Mp3);
  EXPECT_EQ(outcome.result.text, "hello there");

  std::vector<TranscriptionRequest> uploads = rig.client.uploads();
  ASSERT_EQ(uploads.size(), 2u);
  EXPECT_EQ(uploads[0].format, AudioEncoding::Wav);
  EXPECT_EQ(uploads[0].language, "de");
  EXPECT_EQ(uploads[0].model, "whisper-1");

  const std::string tag = "ENC:mp3:";
  ASSERT_GT(uploads[1].audio.size(), tag.size());
  EXPECT_EQ(std::string(uploads[1].audio.begin(), uploads[1].audio.begin() + tag.size()), tag);
}

TEST(FailoverExecutor, EndpointLanguageUsedWhenCallerGivesNone)
{
  Rig rig;
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);
  executor.transcribe(capture(), "");
  ASSERT_EQ(rig.client.uploads().size(), 1u);
  EXPECT_EQ(rig.client.uploads()[0].language, "en");
}

TEST(FailoverExecutor, CallerVoiceOverridesEndpointDefault)
{
  Rig rig;
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);
  SynthesisOptions options = hello();
  options.voice = "nova";
  options.speed = 1.5;

  SynthesisOutcome outcome = executor.synthesize(options);
  EXPECT_EQ(outcome.voice, "nova");
  ASSERT_EQ(rig.client.speechRequests().size(), 1u);
  EXPECT_EQ(rig.client.speechRequests()[0].voice, "nova");
  EXPECT_DOUBLE_EQ(rig.client.speechRequests()[0].speed, 1.5);
  EXPECT_EQ(rig.client.speechRequests()[0].model, "tts-1");
}

TEST(FailoverExecutor, ProbeAllRecordsEveryEndpoint)
{
  Rig rig;
  rig.client.fail(REMOTE_TTS, AttemptOutcome::Unreachable);
  FailoverExecutor executor(rig.registry, rig.client, rig.codec);

  auto results = executor.probeAll();
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].second, EndpointStatus::Ok);
  EXPECT_EQ(results[1].first->baseUrl, REMOTE_TTS);
  EXPECT_EQ(results[1].second, EndpointStatus::Unreachable);
  EXPECT_EQ(rig.endpoint(ProviderKind::Tts, 1).status.load(), EndpointStatus::Unreachable);
  EXPECT_EQ(rig.endpoint(ProviderKind::Stt, 1).status.load(), EndpointStatus::Ok);
}
