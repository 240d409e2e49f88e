#pragma once

#include "audioCodec.hpp"
#include "errors.hpp"
#include "providerRegistry.hpp"
#include "speechClient.hpp"
#include "wav.hpp"

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Rate of headerless pcm returned by OpenAI-compatible speech endpoints.
constexpr int kSpeechPcmRate = 24000;

enum class CompressionPolicy
{
  Auto,
  Always,
  Never
};

std::optional<CompressionPolicy> parseCompressionPolicy(const std::string &name);

// Remote endpoints that already failed during one conversation. Local
// endpoints are never recorded here.
class FailureMemo
{
public:
  bool contains(const ProviderEndpoint &endpoint) const { return failed_.count(&endpoint) > 0; }
  void add(const ProviderEndpoint &endpoint) { failed_.insert(&endpoint); }
  void clear() { failed_.clear(); }
  size_t size() const { return failed_.size(); }

private:
  std::set<const ProviderEndpoint *> failed_;
};

struct SynthesisOptions
{
  std::string text;
  // Empty means the endpoint's default.
  std::string voice;
  std::string model;
  double speed = 1.0;
};

struct SynthesisOutcome
{
  PcmAudio audio;
  const ProviderEndpoint *endpoint = nullptr;
  std::string voice;
  AudioEncoding format = AudioEncoding::Pcm;
  std::vector<EndpointAttempt> attempts;
};

struct TranscriptionOutcome
{
  TranscriptionResult result;
  const ProviderEndpoint *endpoint = nullptr;
  AudioEncoding format = AudioEncoding::Wav;
  std::vector<EndpointAttempt> attempts;
};

// Tries endpoints of one kind strictly in priority order. Any endpoint
// failure moves straight on to the next one; when none succeeds the call
// throws AllEndpointsFailed with one attempt record per endpoint.
class FailoverExecutor
{
public:
  FailoverExecutor(const ProviderRegistry &registry, SpeechClient &client, AudioCodec &codec,
                   CompressionPolicy compression = CompressionPolicy::Auto);

  SynthesisOutcome synthesize(const SynthesisOptions &options, FailureMemo *memo = nullptr);

  TranscriptionOutcome transcribe(const PcmAudio &audio, const std::string &language, FailureMemo *memo = nullptr);

  // Encoding to request from a TTS endpoint, or nothing when there is no
  // format both sides can handle.
  std::optional<AudioEncoding> negotiateSpeechFormat(const ProviderEndpoint &endpoint) const;

  // Encoding to upload to an STT endpoint.
  std::optional<AudioEncoding> negotiateUploadFormat(const ProviderEndpoint &endpoint) const;

  // Health-checks every endpoint concurrently and records the status.
  std::vector<std::pair<const ProviderEndpoint *, EndpointStatus>> probeAll();

private:
  const ProviderRegistry &registry_;
  SpeechClient &client_;
  AudioCodec &codec_;
  CompressionPolicy compression_;

  bool skipRemembered(const ProviderEndpoint &endpoint, FailureMemo *memo, std::vector<EndpointAttempt> &attempts) const;
  void recordFailure(const ProviderEndpoint &endpoint, AttemptOutcome outcome, const std::string &detail,
                     long elapsedMs, FailureMemo *memo, std::vector<EndpointAttempt> &attempts) const;
  void recordSuccess(const ProviderEndpoint &endpoint, long elapsedMs, std::vector<EndpointAttempt> &attempts) const;
};
