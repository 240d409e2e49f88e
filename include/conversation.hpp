#pragma once

#include "audioCue.hpp"
#include "audioDevice.hpp"
#include "errors.hpp"
#include "failoverExecutor.hpp"
#include "silenceDetector.hpp"
#include "vadClassifier.hpp"
#include "voiceConfig.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class TerminalReason
{
  Completed,
  TimedOut,
  Silent,
  BargeIn,
  TranscriptionFailed
};

const char *toString(TerminalReason reason);

struct ConverseRequest
{
  std::string text;
  bool waitForResponse = true;
  // Skip synthesis and playback entirely.
  bool speak = true;
  std::string voice;
  std::optional<int> minDurationMs;
  std::optional<int> maxDurationMs;
  std::optional<int> vadAggressiveness;
  bool disableSilenceDetection = false;
  std::optional<bool> bargeIn;
  std::string agent = "parley";
};

// One speak/listen round as seen by the caller.
struct ConversationExchange
{
  std::string text;
  std::optional<std::string> transcript;
  TerminalReason reason = TerminalReason::Completed;
  // Listening time when a reply was captured, otherwise playback time.
  long durationMs = 0;

  std::chrono::system_clock::time_point startedAt;
  std::chrono::system_clock::time_point finishedAt;

  std::string voice;
  std::string ttsProvider;
  std::string sttProvider;
  bool spoke = false;
  bool bargedIn = false;
  int repeats = 0;
  std::vector<EndpointAttempt> attempts;

  // Filled when transcription failed.
  std::vector<int16_t> capturedAudio;
  int sampleRate = 0;
  std::string savedAudioPath;
};

// Runs converse(): speak, optionally watch for barge-in, listen until the
// user stops, transcribe. Each call owns a fresh AudioDevice and holds the
// conch for its whole duration.
class ConversationOrchestrator
{
public:
  using DeviceFactory = std::function<std::unique_ptr<AudioDevice>()>;
  using ClassifierFactory = std::function<std::unique_ptr<VoiceActivityClassifier>(int aggressiveness)>;

  ConversationOrchestrator(VoiceConfig config, FailoverExecutor &executor, DeviceFactory devices,
                           ClassifierFactory classifiers = makeVoiceClassifier);

  // Throws DeviceError when the audio device is unavailable or busy, and
  // std::invalid_argument for inconsistent listen bounds.
  ConversationExchange converse(const ConverseRequest &request);

  const VoiceConfig &config() const { return config_; }

private:
  VoiceConfig config_;
  FailoverExecutor &executor_;
  DeviceFactory devices_;
  ClassifierFactory classifiers_;

  ListenOptions listenOptionsFor(const ConverseRequest &request) const;

  // Plays the prompt. Returns the finished capture when the user barged in.
  std::optional<SessionResult> speak(AudioDevice &device, const ConverseRequest &request,
                                     const ListenOptions &listen, FailureMemo &memo, ConversationExchange &exchange);

  std::optional<SessionResult> playWithBargeIn(AudioDevice &device, const PcmAudio &audio,
                                               const ListenOptions &listen, int captureAggressiveness);

  SessionResult captureReply(AudioDevice &device, AudioCue &cue, const ListenOptions &listen, int aggressiveness);

  void transcribe(const SessionResult &session, FailureMemo &memo, ConversationExchange &exchange);

  std::string saveCapture(const std::vector<int16_t> &audio, int sampleRate) const;
};
