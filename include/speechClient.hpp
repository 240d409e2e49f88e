#pragma once

#include "providerRegistry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace httplib
{
class Client;
}

struct SpeechRequest
{
  std::string text;
  std::string voice;
  std::string model;
  double speed = 1.0;
  AudioEncoding format = AudioEncoding::Pcm;
};

struct TranscriptionRequest
{
  std::vector<uint8_t> audio;
  AudioEncoding format = AudioEncoding::Wav;
  std::string model;
  std::string language;
};

struct TranscriptionResult
{
  std::string text;
  std::string language;
  double durationSeconds = 0.0;
  size_t wordCount = 0;
};

struct HttpTimeouts
{
  int connectMs = 2000;
  int readMs = 30000;
};

// OpenAI-compatible speech API. Every failure is thrown as an EndpointError
// subclass so the caller can move on to the next endpoint.
class SpeechClient
{
public:
  virtual ~SpeechClient() = default;

  // Returns the encoded audio bytes in request.format.
  virtual std::vector<uint8_t> synthesize(const ProviderEndpoint &endpoint, const SpeechRequest &request) = 0;

  virtual TranscriptionResult transcribe(const ProviderEndpoint &endpoint, const TranscriptionRequest &request) = 0;

  // GET {base}/models
  virtual void probe(const ProviderEndpoint &endpoint) = 0;
};

class HttpSpeechClient : public SpeechClient
{
public:
  explicit HttpSpeechClient(HttpTimeouts timeouts);

  std::vector<uint8_t> synthesize(const ProviderEndpoint &endpoint, const SpeechRequest &request) override;
  TranscriptionResult transcribe(const ProviderEndpoint &endpoint, const TranscriptionRequest &request) override;
  void probe(const ProviderEndpoint &endpoint) override;

private:
  HttpTimeouts timeouts_;

  std::unique_ptr<httplib::Client> connect(const ProviderEndpoint &endpoint, std::string &pathPrefix) const;
};

const char *mimeTypeFor(AudioEncoding encoding);
const char *fileExtensionFor(AudioEncoding encoding);

// JSON body for POST /audio/speech.
std::string speechRequestBody(const SpeechRequest &request);

// Parses a transcription response body. Throws EndpointBadResponse.
TranscriptionResult parseTranscription(const std::string &endpoint, const std::string &body);
