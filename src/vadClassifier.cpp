#include "vadClassifier.hpp"
#include "errors.hpp"
#include "AppLogger.hpp"

#include <fvad.h>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace
{
constexpr int kVadRate = 16000;
}

FvadClassifier::FvadClassifier(int aggressiveness, int sampleRate)
    : aggressiveness_(aggressiveness), sampleRate_(sampleRate)
{
  if (aggressiveness < 0 || aggressiveness > 3)
  {
    throw std::invalid_argument("VAD aggressiveness must be 0-3, got " + std::to_string(aggressiveness));
  }
  if (!supportsRate(sampleRate))
  {
    throw std::invalid_argument("VAD sample rate must be 8000, 16000, 32000 or 48000, got " + std::to_string(sampleRate));
  }

  vad_ = fvad_new();
  if (!vad_)
  {
    throw std::runtime_error("failed to create fvad instance");
  }
  if (fvad_set_sample_rate(vad_, sampleRate) < 0 || fvad_set_mode(vad_, aggressiveness) < 0)
  {
    fvad_free(vad_);
    vad_ = nullptr;
    throw std::runtime_error("failed to configure fvad instance");
  }

  AppLogger::getInstance().debug("VAD initialized (sample_rate=" + std::to_string(sampleRate) +
                                 "Hz, mode=" + std::to_string(aggressiveness) + ")");
}

FvadClassifier::~FvadClassifier()
{
  if (vad_)
  {
    fvad_free(vad_);
  }
}

bool FvadClassifier::supportsRate(int sampleRate)
{
  return sampleRate == 8000 || sampleRate == 16000 || sampleRate == 32000 || sampleRate == 48000;
}

bool FvadClassifier::supportsShape(int sampleRate, size_t samples)
{
  if (!supportsRate(sampleRate))
  {
    return false;
  }
  for (int ms : {10, 20, 30})
  {
    if (samples == samplesFor(sampleRate, ms))
    {
      return true;
    }
  }
  return false;
}

bool FvadClassifier::isSpeech(const AudioFrame &frame)
{
  if (frame.sampleRate != sampleRate_ || !supportsShape(frame.sampleRate, frame.size()))
  {
    throw ClassifierInputError("VAD frame of " + std::to_string(frame.size()) + " samples at " +
                               std::to_string(frame.sampleRate) + "Hz does not match " +
                               std::to_string(sampleRate_) + "Hz 10/20/30 ms");
  }

  int result = fvad_process(vad_, frame.samples.data(), frame.size());
  if (result < 0)
  {
    throw ClassifierInputError("fvad_process rejected frame of " + std::to_string(frame.size()) + " samples");
  }
  return result == 1;
}

ResamplingClassifier::ResamplingClassifier(std::unique_ptr<VoiceActivityClassifier> inner, int innerRate)
    : inner_(std::move(inner)), innerRate_(innerRate)
{
}

bool ResamplingClassifier::isSpeech(const AudioFrame &frame)
{
  if (frame.sampleRate <= 0 || frame.samples.empty())
  {
    throw ClassifierInputError("empty VAD frame of " + std::to_string(frame.size()) + " samples at " +
                               std::to_string(frame.sampleRate) + "Hz");
  }

  // 661 samples at 22050Hz count as 30 ms.
  const long frameMs = std::lround(static_cast<double>(frame.size()) * 1000.0 / frame.sampleRate);
  int chunkMs = 10;
  for (int ms : {30, 20})
  {
    if (frameMs >= ms && frameMs % ms == 0)
    {
      chunkMs = ms;
      break;
    }
  }
  const size_t chunkSamples = samplesFor(innerRate_, chunkMs);

  std::vector<int16_t> resampled = resampleLinear(frame.samples, frame.sampleRate, innerRate_);
  pending_.insert(pending_.end(), resampled.begin(), resampled.end());

  int chunks = 0;
  int speechChunks = 0;
  size_t offset = 0;
  while (pending_.size() - offset >= chunkSamples)
  {
    auto begin = pending_.begin() + static_cast<std::ptrdiff_t>(offset);
    AudioFrame chunk(std::vector<int16_t>(begin, begin + static_cast<std::ptrdiff_t>(chunkSamples)), innerRate_);
    if (inner_->isSpeech(chunk))
    {
      ++speechChunks;
    }
    ++chunks;
    offset += chunkSamples;
  }
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));

  if (chunks > 0)
  {
    lastSpeech_ = speechChunks * 2 >= chunks;
  }
  return lastSpeech_;
}

std::unique_ptr<VoiceActivityClassifier> makeVoiceClassifier(int aggressiveness)
{
  return std::make_unique<ResamplingClassifier>(std::make_unique<FvadClassifier>(aggressiveness, kVadRate), kVadRate);
}
