#pragma once

#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// Fixed-length block of mono 16-bit PCM.
struct AudioFrame
{
  std::vector<int16_t> samples;
  int sampleRate = 16000;

  AudioFrame() = default;
  AudioFrame(std::vector<int16_t> pcm, int rate) : samples(std::move(pcm)), sampleRate(rate) {}

  size_t size() const { return samples.size(); }
  bool empty() const { return samples.empty(); }

  // Integer milliseconds; frames are always whole milliseconds long.
  int durationMs() const
  {
    return sampleRate > 0 ? static_cast<int>((samples.size() * 1000) / static_cast<size_t>(sampleRate)) : 0;
  }
};

inline size_t samplesFor(int sampleRate, int durationMs)
{
  return static_cast<size_t>(sampleRate) * static_cast<size_t>(durationMs) / 1000;
}

inline long durationMsOf(size_t samples, int sampleRate)
{
  return sampleRate > 0 ? static_cast<long>(samples * 1000 / static_cast<size_t>(sampleRate)) : 0;
}

// Linear-interpolation resampler. Output length is n * toRate / fromRate.
std::vector<int16_t> resampleLinear(const int16_t *input, size_t count, int fromRate, int toRate);

inline std::vector<int16_t> resampleLinear(const std::vector<int16_t> &input, int fromRate, int toRate)
{
  return resampleLinear(input.data(), input.size(), fromRate, toRate);
}
