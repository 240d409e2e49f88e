#pragma once

#include "audioDevice.hpp"
#include "silenceDetector.hpp"
#include "vadClassifier.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

struct BargeInOptions
{
  int vadAggressiveness = 2;
  // Continuous speech needed before playback is interrupted.
  int minSpeechMs = 150;
};

// Pure barge-in decision over classified frames. Audio is kept from the first
// frame of the current speech run; a non-speech frame before the trigger
// discards it. After the trigger every frame is kept.
class BargeInDetector
{
public:
  explicit BargeInDetector(int minSpeechMs);

  // True only on the frame that fires the trigger.
  bool feed(const AudioFrame &frame, bool speech);

  bool triggered() const { return triggered_; }
  long speechMs() const { return speechMs_; }
  long trailingSilenceMs() const { return trailingSilenceMs_; }
  int sampleRate() const { return sampleRate_; }
  const std::vector<int16_t> &captured() const { return captured_; }

  void reset();

private:
  int minSpeechMs_;
  bool triggered_ = false;
  long speechMs_ = 0;
  long trailingSilenceMs_ = 0;
  int sampleRate_ = 0;
  std::vector<int16_t> captured_;
};

// Watches the microphone while TTS plays. On trigger it calls
// onVoiceDetected (which should cut playback) and keeps capturing so the
// utterance can be handed to a SilenceDetector without losing audio.
class BargeInMonitor
{
public:
  using ResultCallback = std::function<void(SessionResult)>;
  using ErrorCallback = std::function<void(std::exception_ptr)>;

  BargeInMonitor(AudioDevice &device, VoiceActivityClassifier &classifier, BargeInOptions options);
  ~BargeInMonitor();

  BargeInMonitor(const BargeInMonitor &) = delete;
  BargeInMonitor &operator=(const BargeInMonitor &) = delete;

  // Throws std::logic_error if already monitoring.
  void start(std::function<void()> onVoiceDetected);

  // Stops capture. Safe to call repeatedly or without start().
  void stop();

  // Settles the outcome once playback is over: returns true if the trigger
  // already fired, otherwise blocks any later trigger. Capture keeps running
  // so a triggered utterance can still be handed off.
  bool disarm();

  bool isMonitoring() const { return monitoring_.load(); }
  bool voiceDetected() const { return triggered_.load(); }

  // Audio from speech onset; empty when nothing triggered.
  std::vector<int16_t> capturedAudio() const;

  // Seeds the listener with the captured utterance and routes all further
  // capture into it. onResult runs on the capture thread, once. If the
  // listener throws, onError gets the exception instead and capture is
  // ignored from then on.
  void handOff(SilenceDetector &listener, ResultCallback onResult, ErrorCallback onError = nullptr);

private:
  AudioDevice &device_;
  VoiceActivityClassifier &classifier_;
  BargeInOptions options_;

  mutable std::mutex mutex_;
  BargeInDetector detector_;
  SilenceDetector *listener_ = nullptr;
  ResultCallback onResult_;
  ErrorCallback onError_;
  std::function<void()> onVoiceDetected_;
  bool disarmed_ = false;

  std::atomic<bool> monitoring_{false};
  std::atomic<bool> triggered_{false};

  void onFrame(const AudioFrame &frame);
};
