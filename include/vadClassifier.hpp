#pragma once

#include "audioFrame.hpp"

#include <memory>
#include <vector>

struct Fvad;

// Per-frame speech/non-speech judgment.
class VoiceActivityClassifier
{
public:
  virtual ~VoiceActivityClassifier() = default;

  virtual bool isSpeech(const AudioFrame &frame) = 0;
};

// WebRTC VAD through libfvad. Accepts only 10/20/30 ms frames at
// 8/16/32/48 kHz and throws ClassifierInputError for anything else.
class FvadClassifier : public VoiceActivityClassifier
{
public:
  explicit FvadClassifier(int aggressiveness, int sampleRate = 16000);
  ~FvadClassifier() override;

  FvadClassifier(const FvadClassifier &) = delete;
  FvadClassifier &operator=(const FvadClassifier &) = delete;

  bool isSpeech(const AudioFrame &frame) override;

  int sampleRate() const { return sampleRate_; }
  int aggressiveness() const { return aggressiveness_; }

  static bool supportsRate(int sampleRate);
  static bool supportsShape(int sampleRate, size_t samples);

private:
  Fvad *vad_ = nullptr;
  int aggressiveness_;
  int sampleRate_;
};

// Resamples frames of any rate and length to the inner classifier's rate and
// cuts them into the longest legal chunk (30, 20 or 10 ms) that divides the
// frame duration. Samples short of a chunk carry over to the next call.
// Speech when at least half of the chunks completed by this frame are
// speech; a frame that completes no chunk repeats the previous judgment.
class ResamplingClassifier : public VoiceActivityClassifier
{
public:
  ResamplingClassifier(std::unique_ptr<VoiceActivityClassifier> inner, int innerRate);

  bool isSpeech(const AudioFrame &frame) override;

  size_t pendingSamples() const { return pending_.size(); }

private:
  std::unique_ptr<VoiceActivityClassifier> inner_;
  int innerRate_;
  std::vector<int16_t> pending_;
  bool lastSpeech_ = false;
};

// Fvad at 16 kHz behind a resampling adapter.
std::unique_ptr<VoiceActivityClassifier> makeVoiceClassifier(int aggressiveness);
