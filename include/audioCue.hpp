#pragma once

#include "audioDevice.hpp"

#include <cstdint>
#include <vector>

enum class CueKind
{
  StartListening,
  StopListening
};

struct CueOptions
{
  bool enabled = true;
  // Silence around the tones so Bluetooth sinks wake up before the chime
  // and do not clip its tail.
  int leadSilenceMs = 100;
  int trailSilenceMs = 100;
  float volume = 0.3f;
};

class AudioCue
{
public:
  virtual ~AudioCue() = default;

  // Blocks until the cue has played.
  virtual void play(CueKind kind) = 0;
};

// Two short sine tones: rising to start listening, falling to stop.
class ChimeCue : public AudioCue
{
public:
  ChimeCue(AudioDevice &device, CueOptions options);

  void play(CueKind kind) override;

  static std::vector<int16_t> render(CueKind kind, int sampleRate, const CueOptions &options);

private:
  AudioDevice &device_;
  CueOptions options_;
};
