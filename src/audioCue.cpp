#include "audioCue.hpp"
#include "AppLogger.hpp"

#include <chrono>
#include <cmath>
#include <string>

namespace
{

constexpr double kPi = 3.14159265358979323846;
constexpr int kToneMs = 90;
constexpr int kGapMs = 20;
constexpr int kFadeMs = 8;

void appendTone(std::vector<int16_t> &out, int sampleRate, double frequency, float volume)
{
  const size_t count = samplesFor(sampleRate, kToneMs);
  const size_t fade = samplesFor(sampleRate, kFadeMs);
  for (size_t i = 0; i < count; ++i)
  {
    double envelope = 1.0;
    if (i < fade)
    {
      envelope = static_cast<double>(i) / fade;
    }
    else if (i + fade > count)
    {
      envelope = static_cast<double>(count - i) / fade;
    }
    const double value = std::sin(2.0 * kPi * frequency * i / sampleRate) * envelope * volume;
    out.push_back(static_cast<int16_t>(value * 32767.0));
  }
}

}

ChimeCue::ChimeCue(AudioDevice &device, CueOptions options) : device_(device), options_(options)
{
}

std::vector<int16_t> ChimeCue::render(CueKind kind, int sampleRate, const CueOptions &options)
{
  const double low = 660.0;
  const double high = 880.0;
  const bool rising = kind == CueKind::StartListening;

  std::vector<int16_t> samples(samplesFor(sampleRate, options.leadSilenceMs), 0);
  appendTone(samples, sampleRate, rising ? low : high, options.volume);
  samples.insert(samples.end(), samplesFor(sampleRate, kGapMs), 0);
  appendTone(samples, sampleRate, rising ? high : low, options.volume);
  samples.insert(samples.end(), samplesFor(sampleRate, options.trailSilenceMs), 0);
  return samples;
}

void ChimeCue::play(CueKind kind)
{
  if (!options_.enabled)
  {
    return;
  }

  const int sampleRate = device_.format().sampleRate;
  std::vector<int16_t> samples = render(kind, sampleRate, options_);
  const long durationMs = durationMsOf(samples.size(), sampleRate);

  AppLogger::getInstance().debug(std::string("Playing ") +
                                 (kind == CueKind::StartListening ? "start" : "stop") + " cue");
  device_.play(samples, sampleRate);
  if (!device_.waitPlayback(std::chrono::milliseconds(durationMs + 1000)))
  {
    AppLogger::getInstance().warn("Cue playback did not finish; cutting it off.");
    device_.stopPlayback();
  }
}
