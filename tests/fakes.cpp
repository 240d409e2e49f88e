#include "fakes.hpp"
#include "failoverExecutor.hpp"
#include "wav.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>

AudioFrame speechFrame(int sampleRate, int ms)
{
  return AudioFrame(std::vector<int16_t>(samplesFor(sampleRate, ms), kSpeechLevel), sampleRate);
}

AudioFrame silenceFrame(int sampleRate, int ms)
{
  return AudioFrame(std::vector<int16_t>(samplesFor(sampleRate, ms), 0), sampleRate);
}

bool ScriptedClassifier::isSpeech(const AudioFrame &frame)
{
  calls++;
  for (int16_t sample : frame.samples)
  {
    if (std::abs(static_cast<int>(sample)) >= kSpeechLevel / 2)
    {
      return true;
    }
  }
  return false;
}

// ---------------- FakeAudioDevice ----------------

FakeAudioDevice::FakeAudioDevice(std::vector<MicSegment> script) : script_(std::move(script))
{
}

FakeAudioDevice::~FakeAudioDevice()
{
  close();
}

void FakeAudioDevice::open(const AudioFormat &format)
{
  if (failOpen)
  {
    throw DeviceError("no input device");
  }
  format_ = format;
  opened_ = true;
}

void FakeAudioDevice::close()
{
  stopCapture();
  joinCapture();
  stopPlayback();
  opened_ = false;
}

bool FakeAudioDevice::speechAt(long ms) const
{
  long start = 0;
  for (const MicSegment &segment : script_)
  {
    if (ms < start + segment.durationMs)
    {
      return segment.speech;
    }
    start += segment.durationMs;
  }
  return false;
}

void FakeAudioDevice::startCapture(FrameSink sink)
{
  joinCapture();
  if (capturing_.load())
  {
    return;
  }
  sink_ = std::move(sink);
  capturing_.store(true);
  captureStarts_++;
  captureThread_ = std::thread(&FakeAudioDevice::captureLoop, this);
}

void FakeAudioDevice::stopCapture()
{
  capturing_.store(false);
  if (captureThread_.joinable() && captureThread_.get_id() != std::this_thread::get_id())
  {
    captureThread_.join();
  }
}

void FakeAudioDevice::joinCapture()
{
  if (!capturing_.load() && captureThread_.joinable() && captureThread_.get_id() != std::this_thread::get_id())
  {
    captureThread_.join();
  }
}

void FakeAudioDevice::captureLoop()
{
  const int frameMs = format_.frameMs;
  const size_t frameSamples = format_.frameSamples();

  while (capturing_.load())
  {
    AudioFrame frame;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const int16_t level = speechAt(micMs_) ? kSpeechLevel : 0;
      frame = AudioFrame(std::vector<int16_t>(frameSamples, level), format_.sampleRate);
      micMs_ += frameMs;

      if (playing_)
      {
        playElapsedMs_ += frameMs;
        if (playElapsedMs_ >= playDurationMs_)
        {
          playElapsedMs_ = playDurationMs_;
          playing_ = false;
          cv_.notify_all();
        }
      }
    }

    sink_(frame);
    // Gives the consuming thread time to react between frames.
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

void FakeAudioDevice::play(const std::vector<int16_t> &samples, int sampleRate)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playing_)
  {
    playElapsedMs_ = 0;
    playDurationMs_ = 0;
  }
  played_.push_back(samples);
  playRate_ = sampleRate;
  playDurationMs_ += durationMsOf(samples.size(), sampleRate);
  playing_ = playDurationMs_ > playElapsedMs_;
}

bool FakeAudioDevice::waitPlayback(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(mutex_);
  if (!capturing_.load())
  {
    if (playing_)
    {
      playElapsedMs_ = playDurationMs_;
      playing_ = false;
    }
    return true;
  }
  return cv_.wait_for(lock, timeout, [this] { return !playing_; });
}

void FakeAudioDevice::stopPlayback()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (playing_)
  {
    cutAtMs_ = playElapsedMs_;
    playing_ = false;
    cv_.notify_all();
  }
}

bool FakeAudioDevice::isPlaying() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return playing_;
}

size_t FakeAudioDevice::playedSamples() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return samplesFor(playRate_, static_cast<int>(playElapsedMs_));
}

std::vector<std::vector<int16_t>> FakeAudioDevice::playedBuffers() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return played_;
}

long FakeAudioDevice::cutAtMs() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return cutAtMs_;
}

long FakeAudioDevice::micPositionMs() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return micMs_;
}

// ---------------- FakeCodec ----------------

std::vector<uint8_t> FakeCodec::tag(AudioEncoding encoding, const std::vector<uint8_t> &wav)
{
  std::string prefix = std::string("ENC:") + toString(encoding) + ":";
  std::vector<uint8_t> bytes(prefix.begin(), prefix.end());
  bytes.insert(bytes.end(), wav.begin(), wav.end());
  return bytes;
}

std::vector<uint8_t> FakeCodec::encode(const PcmAudio &audio, AudioEncoding encoding)
{
  if (!canEncode(encoding))
  {
    throw CodecError(std::string("cannot encode ") + toString(encoding));
  }
  if (encoding == AudioEncoding::Pcm)
  {
    const uint8_t *bytes = reinterpret_cast<const uint8_t *>(audio.samples.data());
    return std::vector<uint8_t>(bytes, bytes + audio.samples.size() * sizeof(int16_t));
  }
  std::vector<uint8_t> wav = createWavFromPCM(audio.samples, audio.sampleRate, 1);
  return encoding == AudioEncoding::Wav ? wav : tag(encoding, wav);
}

PcmAudio FakeCodec::decode(const std::vector<uint8_t> &bytes, AudioEncoding encoding, int rawRate)
{
  if (!canDecode(encoding))
  {
    throw CodecError(std::string("cannot decode ") + toString(encoding));
  }
  if (encoding == AudioEncoding::Pcm)
  {
    return pcmFromBytes(bytes, rawRate);
  }
  std::vector<uint8_t> wav = bytes;
  if (encoding != AudioEncoding::Wav)
  {
    const std::string prefix = std::string("ENC:") + toString(encoding) + ":";
    if (bytes.size() < prefix.size() || std::memcmp(bytes.data(), prefix.data(), prefix.size()) != 0)
    {
      throw CodecError("not a tagged " + std::string(toString(encoding)) + " buffer");
    }
    wav.erase(wav.begin(), wav.begin() + static_cast<std::ptrdiff_t>(prefix.size()));
  }
  try
  {
    return parseWav(wav);
  }
  catch (const std::runtime_error &e)
  {
    throw CodecError(e.what());
  }
}

// ---------------- FakeSpeechClient ----------------

void FakeSpeechClient::fail(const std::string &baseUrl, AttemptOutcome outcome)
{
  std::lock_guard<std::mutex> lock(mutex_);
  failures_[baseUrl] = outcome;
}

void FakeSpeechClient::recover(const std::string &baseUrl)
{
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.erase(baseUrl);
}

void FakeSpeechClient::maybeFail(const ProviderEndpoint &endpoint)
{
  auto it = failures_.find(endpoint.baseUrl);
  if (it == failures_.end())
  {
    return;
  }
  switch (it->second)
  {
  case AttemptOutcome::Timeout:
    throw EndpointTimeout(endpoint.baseUrl, "read timed out");
  case AttemptOutcome::BadResponse:
    throw EndpointBadResponse(endpoint.baseUrl, "status 500");
  default:
    throw EndpointUnreachable(endpoint.baseUrl, "connection refused");
  }
}

std::vector<uint8_t> FakeSpeechClient::synthesize(const ProviderEndpoint &endpoint, const SpeechRequest &request)
{
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.push_back("tts " + endpoint.baseUrl);
  speechRequests_.push_back(request);
  speechBodies_.push_back(speechRequestBody(request));
  maybeFail(endpoint);

  std::vector<int16_t> tone(samplesFor(kSpeechPcmRate, speechMs), 1200);
  if (request.format == AudioEncoding::Pcm)
  {
    const uint8_t *bytes = reinterpret_cast<const uint8_t *>(tone.data());
    return std::vector<uint8_t>(bytes, bytes + tone.size() * sizeof(int16_t));
  }
  std::vector<uint8_t> wav = createWavFromPCM(tone, kSpeechPcmRate, 1);
  return request.format == AudioEncoding::Wav ? wav : FakeCodec::tag(request.format, wav);
}

TranscriptionResult FakeSpeechClient::transcribe(const ProviderEndpoint &endpoint,
                                                 const TranscriptionRequest &request)
{
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.push_back("stt " + endpoint.baseUrl);
  uploads_.push_back(request);
  maybeFail(endpoint);

  TranscriptionResult result;
  if (!transcripts.empty())
  {
    result.text = transcripts[std::min(transcriptIndex_, transcripts.size() - 1)];
    transcriptIndex_++;
  }
  return result;
}

void FakeSpeechClient::probe(const ProviderEndpoint &endpoint)
{
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.push_back("probe " + endpoint.baseUrl);
  maybeFail(endpoint);
}

std::vector<std::string> FakeSpeechClient::calls() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::vector<TranscriptionRequest> FakeSpeechClient::uploads() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_;
}

std::vector<SpeechRequest> FakeSpeechClient::speechRequests() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return speechRequests_;
}

std::vector<std::string> FakeSpeechClient::speechBodies() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return speechBodies_;
}
