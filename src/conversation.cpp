#include "conversation.hpp"
#include "AppLogger.hpp"
#include "bargeInMonitor.hpp"
#include "conch.hpp"
#include "handoffQueue.hpp"
#include "phrases.hpp"
#include "wav.hpp"

#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace
{

// Extra wait beyond the longest possible session before the microphone is
// declared dead.
constexpr int kStallGraceMs = 5000;
// Extra wait beyond the prompt length before playback is cut off.
constexpr int kPlaybackGraceMs = 5000;

// Stops capture when the listening scope unwinds.
class CaptureGuard
{
public:
  explicit CaptureGuard(AudioDevice &device) : device_(device) {}
  ~CaptureGuard() { device_.stopCapture(); }

  CaptureGuard(const CaptureGuard &) = delete;
  CaptureGuard &operator=(const CaptureGuard &) = delete;

private:
  AudioDevice &device_;
};

void appendAttempts(std::vector<EndpointAttempt> &to, const std::vector<EndpointAttempt> &from)
{
  to.insert(to.end(), from.begin(), from.end());
}

TerminalReason terminalReasonFor(StopReason reason)
{
  switch (reason)
  {
  case StopReason::Completed:
    return TerminalReason::Completed;
  case StopReason::TimedOut:
    return TerminalReason::TimedOut;
  case StopReason::Silent:
    return TerminalReason::Silent;
  }
  return TerminalReason::Completed;
}

}

const char *toString(TerminalReason reason)
{
  switch (reason)
  {
  case TerminalReason::Completed:
    return "completed";
  case TerminalReason::TimedOut:
    return "timed_out";
  case TerminalReason::Silent:
    return "silent";
  case TerminalReason::BargeIn:
    return "barge_in";
  case TerminalReason::TranscriptionFailed:
    return "transcription_failed";
  }
  return "unknown";
}

ConversationOrchestrator::ConversationOrchestrator(VoiceConfig config, FailoverExecutor &executor,
                                                   DeviceFactory devices, ClassifierFactory classifiers)
    : config_(std::move(config)), executor_(executor), devices_(std::move(devices)),
      classifiers_(std::move(classifiers))
{
}

ListenOptions ConversationOrchestrator::listenOptionsFor(const ConverseRequest &request) const
{
  ListenOptions listen = config_.listen;
  if (request.minDurationMs)
  {
    listen.minDurationMs = *request.minDurationMs;
  }
  if (request.maxDurationMs)
  {
    listen.maxDurationMs = *request.maxDurationMs;
  }
  listen.disableSilenceDetection = request.disableSilenceDetection;

  if (listen.maxDurationMs <= 0 || listen.minDurationMs < 0 || listen.minDurationMs > listen.maxDurationMs)
  {
    throw std::invalid_argument("listen duration must satisfy 0 <= min <= max and max > 0 (min=" +
                                std::to_string(listen.minDurationMs) +
                                "ms, max=" + std::to_string(listen.maxDurationMs) + "ms)");
  }
  return listen;
}

ConversationExchange ConversationOrchestrator::converse(const ConverseRequest &request)
{
  ConversationExchange exchange;
  exchange.text = request.text;
  exchange.startedAt = std::chrono::system_clock::now();

  const ListenOptions listenOptions = listenOptionsFor(request);
  const int aggressiveness = request.vadAggressiveness.value_or(config_.vadAggressiveness);
  if (aggressiveness < 0 || aggressiveness > 3)
  {
    throw std::invalid_argument("VAD aggressiveness must be 0-3, got " + std::to_string(aggressiveness));
  }

  const bool speaking = request.speak && !request.text.empty();
  if (!speaking && !request.waitForResponse)
  {
    exchange.finishedAt = std::chrono::system_clock::now();
    return exchange;
  }

  Conch conch(config_.lockFile);
  if (!conch.tryAcquire(request.agent))
  {
    std::optional<ConchHolder> holder = Conch::holder(config_.lockFile);
    throw DeviceError("audio is in use by another conversation" +
                      (holder ? " (" + holder->agent + ", pid " + std::to_string(holder->pid) + ")" : std::string()));
  }
  ConchGuard conchGuard(conch);

  std::unique_ptr<AudioDevice> device = devices_();
  device->open(config_.audio);
  ChimeCue cue(*device, config_.cue);
  FailureMemo memo;

  AppLogger::getInstance().info("converse: text=\"" + request.text + "\" wait=" +
                                (request.waitForResponse ? "true" : "false") +
                                " max=" + std::to_string(listenOptions.maxDurationMs) + "ms");

  while (true)
  {
    std::optional<SessionResult> session;
    exchange.bargedIn = false;

    if (speaking)
    {
      session = speak(*device, request, listenOptions, memo, exchange);
    }

    if (!request.waitForResponse)
    {
      exchange.reason = TerminalReason::Completed;
      break;
    }

    if (session)
    {
      exchange.bargedIn = true;
    }
    else
    {
      session = captureReply(*device, cue, listenOptions, aggressiveness);
    }
    cue.play(CueKind::StopListening);

    exchange.durationMs = session->elapsedMs;
    exchange.transcript.reset();
    exchange.capturedAudio.clear();
    exchange.savedAudioPath.clear();

    if (session->reason == StopReason::Silent)
    {
      AppLogger::getInstance().info("No speech detected; skipping transcription.");
      exchange.reason = TerminalReason::Silent;
      break;
    }

    transcribe(*session, memo, exchange);

    if (config_.repeatPhrases && exchange.transcript && shouldRepeat(*exchange.transcript) && speaking &&
        exchange.repeats < config_.maxRepeats)
    {
      ++exchange.repeats;
      AppLogger::getInstance().info("Repeat requested (\"" + *exchange.transcript + "\"), replaying prompt " +
                                    std::to_string(exchange.repeats) + "/" + std::to_string(config_.maxRepeats));
      continue;
    }
    break;
  }

  device->close();
  exchange.finishedAt = std::chrono::system_clock::now();

  AppLogger::getInstance().info(std::string("converse finished: reason=") + toString(exchange.reason) +
                                " duration=" + std::to_string(exchange.durationMs) + "ms transcript=" +
                                (exchange.transcript ? "\"" + *exchange.transcript + "\"" : "null"));
  return exchange;
}

std::optional<SessionResult> ConversationOrchestrator::speak(AudioDevice &device, const ConverseRequest &request,
                                                             const ListenOptions &listen, FailureMemo &memo,
                                                             ConversationExchange &exchange)
{
  SynthesisOptions options;
  options.text = request.text;
  options.voice = request.voice;
  options.speed = config_.ttsSpeed;

  SynthesisOutcome synthesis;
  try
  {
    synthesis = executor_.synthesize(options, &memo);
    appendAttempts(exchange.attempts, synthesis.attempts);
  }
  catch (const AllEndpointsFailed &e)
  {
    appendAttempts(exchange.attempts, e.attempts());
    AppLogger::getInstance().error(std::string("Speech synthesis failed, listening anyway: ") + e.what());
    return std::nullopt;
  }

  exchange.voice = synthesis.voice;
  exchange.ttsProvider = synthesis.endpoint->baseUrl;
  exchange.spoke = true;

  const bool bargeIn = request.waitForResponse && request.bargeIn.value_or(config_.bargeInEnabled);
  const long promptMs = durationMsOf(synthesis.audio.samples.size(), synthesis.audio.sampleRate);
  if (!request.waitForResponse)
  {
    exchange.durationMs = promptMs;
  }

  if (bargeIn)
  {
    return playWithBargeIn(device, synthesis.audio, listen,
                           request.vadAggressiveness.value_or(config_.vadAggressiveness));
  }

  device.play(synthesis.audio.samples, synthesis.audio.sampleRate);
  if (!device.waitPlayback(std::chrono::milliseconds(promptMs + kPlaybackGraceMs)))
  {
    AppLogger::getInstance().warn("Playback did not drain in time; stopping it.");
    device.stopPlayback();
  }
  return std::nullopt;
}

std::optional<SessionResult> ConversationOrchestrator::playWithBargeIn(AudioDevice &device, const PcmAudio &audio,
                                                                       const ListenOptions &listen,
                                                                       int captureAggressiveness)
{
  // Declared before the monitor so they outlive its capture.
  std::unique_ptr<VoiceActivityClassifier> captureClassifier = classifiers_(captureAggressiveness);
  SilenceDetector detector(*captureClassifier, listen);
  HandoffQueue<SessionResult> results;

  std::unique_ptr<VoiceActivityClassifier> bargeClassifier = classifiers_(config_.bargeIn.vadAggressiveness);
  BargeInMonitor monitor(device, *bargeClassifier, config_.bargeIn);

  device.play(audio.samples, audio.sampleRate);
  monitor.start([&device]() { device.stopPlayback(); });

  const long promptMs = durationMsOf(audio.samples.size(), audio.sampleRate);
  if (!device.waitPlayback(std::chrono::milliseconds(promptMs + kPlaybackGraceMs)))
  {
    AppLogger::getInstance().warn("Playback did not drain in time; stopping it.");
    device.stopPlayback();
  }

  if (!monitor.disarm())
  {
    monitor.stop();
    return std::nullopt;
  }

  AppLogger::getInstance().info("Playback interrupted after " +
                                std::to_string(durationMsOf(device.playedSamples(), audio.sampleRate)) + "ms");

  monitor.handOff(
      detector, [&results](SessionResult result) { results.push(std::move(result)); },
      [&results](std::exception_ptr error) { results.fail(std::move(error)); });
  std::optional<SessionResult> session =
      results.pop(std::chrono::milliseconds(static_cast<long>(listen.maxDurationMs) + kStallGraceMs));
  monitor.stop();

  if (!session)
  {
    throw DeviceError("microphone stopped delivering audio after barge-in");
  }
  return session;
}

SessionResult ConversationOrchestrator::captureReply(AudioDevice &device, AudioCue &cue, const ListenOptions &listen,
                                                     int aggressiveness)
{
  cue.play(CueKind::StartListening);

  std::unique_ptr<VoiceActivityClassifier> classifier = classifiers_(aggressiveness);
  SilenceDetector detector(*classifier, listen);
  HandoffQueue<SessionResult> results;

  std::optional<SessionResult> session;
  {
    // Only touched on the capture thread.
    bool failed = false;
    device.startCapture([&detector, &results, &failed](const AudioFrame &frame) {
      if (failed)
      {
        return;
      }
      try
      {
        std::optional<SessionResult> result = detector.feed(frame);
        if (result)
        {
          results.push(std::move(*result));
        }
      }
      catch (const std::exception &e)
      {
        AppLogger::getInstance().error(std::string("Listening failed: ") + e.what());
        failed = true;
        results.fail(std::current_exception());
      }
    });
    CaptureGuard guard(device);

    AppLogger::getInstance().debug("Listening: min=" + std::to_string(listen.minDurationMs) + "ms max=" +
                                   std::to_string(listen.maxDurationMs) + "ms silence=" +
                                   std::to_string(listen.silenceThresholdMs) + "ms");
    session = results.pop(std::chrono::milliseconds(static_cast<long>(listen.maxDurationMs) + kStallGraceMs));
  }

  if (!session)
  {
    throw DeviceError("microphone stopped delivering audio");
  }
  AppLogger::getInstance().info(std::string("Listening stopped: ") + toString(session->reason) + " after " +
                                std::to_string(session->elapsedMs) + "ms");
  return std::move(*session);
}

void ConversationOrchestrator::transcribe(const SessionResult &session, FailureMemo &memo,
                                          ConversationExchange &exchange)
{
  PcmAudio audio;
  audio.samples = session.audio;
  audio.sampleRate = session.sampleRate;

  try
  {
    TranscriptionOutcome outcome = executor_.transcribe(audio, config_.sttLanguage, &memo);
    appendAttempts(exchange.attempts, outcome.attempts);
    exchange.sttProvider = outcome.endpoint->baseUrl;
    exchange.transcript = outcome.result.text;
    exchange.reason = exchange.bargedIn ? TerminalReason::BargeIn : terminalReasonFor(session.reason);

    if (exchange.bargedIn && trim(outcome.result.text).empty())
    {
      AppLogger::getInstance().warn("BARGE_IN_FALSE_POSITIVE nothing transcribable in " +
                                    std::to_string(session.elapsedMs) + "ms of audio");
    }
    if (config_.saveAll && !config_.saveDirectory.empty())
    {
      exchange.savedAudioPath = saveCapture(session.audio, session.sampleRate);
    }
  }
  catch (const AllEndpointsFailed &e)
  {
    appendAttempts(exchange.attempts, e.attempts());
    AppLogger::getInstance().error(std::string(exchange.bargedIn ? "BARGE_IN_STT_ERROR " : "") +
                                   "Transcription failed: " + e.what());
    exchange.reason = TerminalReason::TranscriptionFailed;
    exchange.transcript.reset();
    exchange.capturedAudio = session.audio;
    exchange.sampleRate = session.sampleRate;
    if (!config_.saveDirectory.empty())
    {
      exchange.savedAudioPath = saveCapture(session.audio, session.sampleRate);
    }
  }
}

std::string ConversationOrchestrator::saveCapture(const std::vector<int16_t> &audio, int sampleRate) const
{
  std::error_code ec;
  std::filesystem::create_directories(config_.saveDirectory, ec);
  if (ec)
  {
    AppLogger::getInstance().error("Failed to create audio directory: " + ec.message());
    return "";
  }

  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  long millis = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
  std::tm local{};
  localtime_r(&seconds, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
  char suffix[8];
  std::snprintf(suffix, sizeof(suffix), "_%03ld", millis);

  std::string path =
      (std::filesystem::path(config_.saveDirectory) / (std::string(stamp) + suffix + "_stt.wav")).string();
  if (!writeWavFile(path, audio, sampleRate))
  {
    AppLogger::getInstance().error("Failed to save audio to: " + path);
    return "";
  }
  AppLogger::getInstance().info("Audio saved to: " + path);
  return path;
}
