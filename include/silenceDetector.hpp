#pragma once

#include "audioFrame.hpp"
#include "vadClassifier.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

enum class VadState
{
  Waiting,
  Active,
  Silence,
  Stopped
};

enum class StopReason
{
  Completed,
  TimedOut,
  Silent
};

const char *toString(VadState state);
const char *toString(StopReason reason);

struct ListenOptions
{
  int minDurationMs = 500;
  int maxDurationMs = 120000;
  int silenceThresholdMs = 1000;
  // Longest wait for the first speech frame before giving up as silent.
  int initialGraceMs = 4000;
  // Audio kept from just before speech onset.
  int preRollMs = 0;
  // Record for maxDurationMs regardless of silence.
  bool disableSilenceDetection = false;
};

struct SessionResult
{
  std::chrono::steady_clock::time_point startedAt;
  std::vector<int16_t> audio;
  int sampleRate = 0;
  long elapsedMs = 0;
  StopReason reason = StopReason::Silent;
  bool speechDetected = false;
};

// One listen attempt. Time is counted in frames, so the deadlines hold even
// when frames arrive in bursts.
struct RecordingSession
{
  std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
  std::vector<int16_t> buffer;
  VadState state = VadState::Waiting;
  long silenceMs = 0;
  long elapsedMs = 0;
  bool speechSeen = false;
};

// Drives a RecordingSession from classifier output.
class SilenceDetector
{
public:
  SilenceDetector(VoiceActivityClassifier &classifier, ListenOptions options);

  // Returns a result exactly once, on the frame that ends the session.
  std::optional<SessionResult> feed(const AudioFrame &frame);

  // Feed with an externally computed judgment.
  std::optional<SessionResult> feed(const AudioFrame &frame, bool speech);

  // Starts the session mid-utterance with audio captured elsewhere (barge-in).
  // trailingSilenceMs is the non-speech tail already inside that audio.
  void resume(const std::vector<int16_t> &audio, int sampleRate, long trailingSilenceMs);

  VadState state() const { return session_.state; }
  long silenceMs() const { return session_.silenceMs; }
  long elapsedMs() const { return session_.elapsedMs; }
  bool finished() const { return session_.state == VadState::Stopped; }
  const ListenOptions &options() const { return options_; }

private:
  VoiceActivityClassifier &classifier_;
  ListenOptions options_;
  RecordingSession session_;
  std::vector<int16_t> preRoll_;
  int sampleRate_ = 0;

  void pushPreRoll(const AudioFrame &frame);
  SessionResult stop(StopReason reason);
};
