#include "failoverExecutor.hpp"
#include "AppLogger.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <initializer_list>

namespace
{

long millisSince(std::chrono::steady_clock::time_point start)
{
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

std::optional<AudioEncoding> firstSupported(const ProviderEndpoint &endpoint,
                                            std::initializer_list<AudioEncoding> preference,
                                            const std::function<bool(AudioEncoding)> &codecSupports)
{
  for (AudioEncoding encoding : preference)
  {
    if (endpoint.accepts(encoding) && codecSupports(encoding))
    {
      return encoding;
    }
  }
  return std::nullopt;
}

}

std::optional<CompressionPolicy> parseCompressionPolicy(const std::string &name)
{
  if (name == "auto")
  {
    return CompressionPolicy::Auto;
  }
  if (name == "always")
  {
    return CompressionPolicy::Always;
  }
  if (name == "never")
  {
    return CompressionPolicy::Never;
  }
  return std::nullopt;
}

FailoverExecutor::FailoverExecutor(const ProviderRegistry &registry, SpeechClient &client, AudioCodec &codec,
                                   CompressionPolicy compression)
    : registry_(registry), client_(client), codec_(codec), compression_(compression)
{
}

std::optional<AudioEncoding> FailoverExecutor::negotiateSpeechFormat(const ProviderEndpoint &endpoint) const
{
  auto decodable = [this](AudioEncoding encoding) { return codec_.canDecode(encoding); };
  if (endpoint.isLocal)
  {
    return firstSupported(endpoint,
                          {AudioEncoding::Pcm, AudioEncoding::Wav, AudioEncoding::Flac, AudioEncoding::Mp3,
                           AudioEncoding::Opus, AudioEncoding::Aac},
                          decodable);
  }
  return firstSupported(endpoint,
                        {AudioEncoding::Mp3, AudioEncoding::Opus, AudioEncoding::Aac, AudioEncoding::Flac,
                         AudioEncoding::Wav, AudioEncoding::Pcm},
                        decodable);
}

std::optional<AudioEncoding> FailoverExecutor::negotiateUploadFormat(const ProviderEndpoint &endpoint) const
{
  auto encodable = [this](AudioEncoding encoding) { return codec_.canEncode(encoding); };

  // Headerless pcm is never uploaded; the server could not know its rate.
  if (compression_ == CompressionPolicy::Never)
  {
    return firstSupported(endpoint, {AudioEncoding::Wav}, encodable);
  }

  const bool compress = compression_ == CompressionPolicy::Always || !endpoint.isLocal;
  if (compress)
  {
    return firstSupported(endpoint,
                          {AudioEncoding::Mp3, AudioEncoding::Opus, AudioEncoding::Flac, AudioEncoding::Aac,
                           AudioEncoding::Wav},
                          encodable);
  }
  return firstSupported(endpoint,
                        {AudioEncoding::Wav, AudioEncoding::Flac, AudioEncoding::Mp3, AudioEncoding::Opus,
                         AudioEncoding::Aac},
                        encodable);
}

bool FailoverExecutor::skipRemembered(const ProviderEndpoint &endpoint, FailureMemo *memo,
                                      std::vector<EndpointAttempt> &attempts) const
{
  if (!memo || endpoint.isLocal || !memo->contains(endpoint))
  {
    return false;
  }
  attempts.push_back({endpoint.baseUrl, AttemptOutcome::Skipped, "failed earlier in this conversation", 0});
  AppLogger::getInstance().debug("Skipping " + endpoint.baseUrl + ": failed earlier in this conversation");
  return true;
}

void FailoverExecutor::recordFailure(const ProviderEndpoint &endpoint, AttemptOutcome outcome,
                                     const std::string &detail, long elapsedMs, FailureMemo *memo,
                                     std::vector<EndpointAttempt> &attempts) const
{
  attempts.push_back({endpoint.baseUrl, outcome, detail, elapsedMs});
  registry_.recordStatus(endpoint, EndpointStatus::Unreachable);
  if (memo && !endpoint.isLocal)
  {
    memo->add(endpoint);
  }
  AppLogger::getInstance().warn(std::string(toString(endpoint.kind)) + " endpoint " + endpoint.baseUrl + " " +
                                toString(outcome) + " after " + std::to_string(elapsedMs) + "ms: " + detail);
}

void FailoverExecutor::recordSuccess(const ProviderEndpoint &endpoint, long elapsedMs,
                                     std::vector<EndpointAttempt> &attempts) const
{
  attempts.push_back({endpoint.baseUrl, AttemptOutcome::Ok, "", elapsedMs});
  registry_.recordStatus(endpoint, EndpointStatus::Ok);
}

SynthesisOutcome FailoverExecutor::synthesize(const SynthesisOptions &options, FailureMemo *memo)
{
  SynthesisOutcome outcome;

  for (const ProviderEndpoint *endpoint : registry_.endpoints(ProviderKind::Tts))
  {
    if (skipRemembered(*endpoint, memo, outcome.attempts))
    {
      continue;
    }

    std::optional<AudioEncoding> format = negotiateSpeechFormat(*endpoint);
    if (!format)
    {
      outcome.attempts.push_back({endpoint->baseUrl, AttemptOutcome::Skipped, "no common audio format", 0});
      continue;
    }

    SpeechRequest request;
    request.text = options.text;
    request.voice = options.voice.empty() ? endpoint->voice : options.voice;
    request.model = options.model.empty() ? endpoint->model : options.model;
    request.speed = options.speed;
    request.format = *format;

    const auto start = std::chrono::steady_clock::now();
    try
    {
      std::vector<uint8_t> bytes = client_.synthesize(*endpoint, request);
      PcmAudio audio = codec_.decode(bytes, *format, kSpeechPcmRate);
      if (audio.samples.empty())
      {
        throw EndpointBadResponse(endpoint->baseUrl, "speech decoded to no audio");
      }

      recordSuccess(*endpoint, millisSince(start), outcome.attempts);
      outcome.audio = std::move(audio);
      outcome.endpoint = endpoint;
      outcome.voice = request.voice;
      outcome.format = *format;
      AppLogger::getInstance().info("TTS via " + endpoint->baseUrl + " voice=" + request.voice + " format=" +
                                    toString(*format) + " (" + std::to_string(outcome.audio.samples.size()) +
                                    " samples)");
      return outcome;
    }
    catch (const EndpointUnreachable &e)
    {
      recordFailure(*endpoint, AttemptOutcome::Unreachable, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const EndpointTimeout &e)
    {
      recordFailure(*endpoint, AttemptOutcome::Timeout, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const EndpointBadResponse &e)
    {
      recordFailure(*endpoint, AttemptOutcome::BadResponse, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const EndpointError &e)
    {
      recordFailure(*endpoint, AttemptOutcome::Unreachable, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const CodecError &e)
    {
      recordFailure(*endpoint, AttemptOutcome::BadResponse, e.what(), millisSince(start), memo, outcome.attempts);
    }
  }

  throw AllEndpointsFailed("synthesize", outcome.attempts);
}

TranscriptionOutcome FailoverExecutor::transcribe(const PcmAudio &audio, const std::string &language,
                                                  FailureMemo *memo)
{
  TranscriptionOutcome outcome;

  for (const ProviderEndpoint *endpoint : registry_.endpoints(ProviderKind::Stt))
  {
    if (skipRemembered(*endpoint, memo, outcome.attempts))
    {
      continue;
    }

    std::optional<AudioEncoding> format = negotiateUploadFormat(*endpoint);
    if (!format)
    {
      outcome.attempts.push_back({endpoint->baseUrl, AttemptOutcome::Skipped, "no common audio format", 0});
      continue;
    }

    TranscriptionRequest request;
    request.format = *format;
    request.model = endpoint->model;
    request.language = language.empty() ? endpoint->language : language;
    try
    {
      request.audio = codec_.encode(audio, *format);
    }
    catch (const CodecError &e)
    {
      if (*format == AudioEncoding::Wav || !endpoint->accepts(AudioEncoding::Wav))
      {
        outcome.attempts.push_back({endpoint->baseUrl, AttemptOutcome::Skipped, e.what(), 0});
        continue;
      }
      AppLogger::getInstance().warn(std::string("Encoding failed, uploading wav instead: ") + e.what());
      request.format = AudioEncoding::Wav;
      request.audio = createWavFromPCM(audio.samples, audio.sampleRate, 1);
    }

    const auto start = std::chrono::steady_clock::now();
    try
    {
      outcome.result = client_.transcribe(*endpoint, request);
      recordSuccess(*endpoint, millisSince(start), outcome.attempts);
      outcome.endpoint = endpoint;
      outcome.format = request.format;
      AppLogger::getInstance().info("STT via " + endpoint->baseUrl + " format=" + toString(request.format) + ": \"" +
                                    outcome.result.text + "\"");
      return outcome;
    }
    catch (const EndpointUnreachable &e)
    {
      recordFailure(*endpoint, AttemptOutcome::Unreachable, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const EndpointTimeout &e)
    {
      recordFailure(*endpoint, AttemptOutcome::Timeout, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const EndpointBadResponse &e)
    {
      recordFailure(*endpoint, AttemptOutcome::BadResponse, e.reason(), millisSince(start), memo, outcome.attempts);
    }
    catch (const EndpointError &e)
    {
      recordFailure(*endpoint, AttemptOutcome::Unreachable, e.reason(), millisSince(start), memo, outcome.attempts);
    }
  }

  throw AllEndpointsFailed("transcribe", outcome.attempts);
}

std::vector<std::pair<const ProviderEndpoint *, EndpointStatus>> FailoverExecutor::probeAll()
{
  std::vector<const ProviderEndpoint *> endpoints = registry_.endpoints(ProviderKind::Tts);
  std::vector<const ProviderEndpoint *> stt = registry_.endpoints(ProviderKind::Stt);
  endpoints.insert(endpoints.end(), stt.begin(), stt.end());

  std::vector<std::future<EndpointStatus>> probes;
  probes.reserve(endpoints.size());
  for (const ProviderEndpoint *endpoint : endpoints)
  {
    probes.push_back(std::async(std::launch::async, [this, endpoint]() {
      try
      {
        client_.probe(*endpoint);
        return EndpointStatus::Ok;
      }
      catch (const EndpointError &e)
      {
        AppLogger::getInstance().warn("Health check failed for " + endpoint->baseUrl + ": " + e.reason());
        return EndpointStatus::Unreachable;
      }
    }));
  }

  std::vector<std::pair<const ProviderEndpoint *, EndpointStatus>> results;
  for (size_t i = 0; i < endpoints.size(); ++i)
  {
    EndpointStatus status = probes[i].get();
    registry_.recordStatus(*endpoints[i], status);
    results.emplace_back(endpoints[i], status);
  }
  return results;
}
