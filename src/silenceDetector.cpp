#include "silenceDetector.hpp"

#include <utility>

const char *toString(VadState state)
{
  switch (state)
  {
  case VadState::Waiting:
    return "waiting";
  case VadState::Active:
    return "active";
  case VadState::Silence:
    return "silence";
  case VadState::Stopped:
    return "stopped";
  }
  return "unknown";
}

const char *toString(StopReason reason)
{
  switch (reason)
  {
  case StopReason::Completed:
    return "completed";
  case StopReason::TimedOut:
    return "timed_out";
  case StopReason::Silent:
    return "silent";
  }
  return "unknown";
}

SilenceDetector::SilenceDetector(VoiceActivityClassifier &classifier, ListenOptions options)
    : classifier_(classifier), options_(options)
{
}

std::optional<SessionResult> SilenceDetector::feed(const AudioFrame &frame)
{
  if (session_.state == VadState::Stopped)
  {
    return std::nullopt;
  }
  return feed(frame, classifier_.isSpeech(frame));
}

std::optional<SessionResult> SilenceDetector::feed(const AudioFrame &frame, bool speech)
{
  if (session_.state == VadState::Stopped)
  {
    return std::nullopt;
  }
  if (sampleRate_ == 0)
  {
    sampleRate_ = frame.sampleRate;
  }

  const int frameMs = frame.durationMs();
  session_.elapsedMs += frameMs;

  if (options_.disableSilenceDetection)
  {
    session_.speechSeen = session_.speechSeen || speech;
    session_.buffer.insert(session_.buffer.end(), frame.samples.begin(), frame.samples.end());
    if (session_.elapsedMs >= options_.maxDurationMs)
    {
      return stop(session_.speechSeen ? StopReason::Completed : StopReason::Silent);
    }
    return std::nullopt;
  }

  switch (session_.state)
  {
  case VadState::Waiting:
    if (speech)
    {
      session_.state = VadState::Active;
      session_.speechSeen = true;
      session_.silenceMs = 0;
      session_.buffer.insert(session_.buffer.end(), preRoll_.begin(), preRoll_.end());
      preRoll_.clear();
      session_.buffer.insert(session_.buffer.end(), frame.samples.begin(), frame.samples.end());
    }
    else
    {
      pushPreRoll(frame);
      if (options_.initialGraceMs > 0 && session_.elapsedMs >= options_.initialGraceMs)
      {
        return stop(StopReason::Silent);
      }
    }
    break;

  case VadState::Active:
    session_.buffer.insert(session_.buffer.end(), frame.samples.begin(), frame.samples.end());
    if (!speech)
    {
      session_.state = VadState::Silence;
      session_.silenceMs += frameMs;
    }
    break;

  case VadState::Silence:
    session_.buffer.insert(session_.buffer.end(), frame.samples.begin(), frame.samples.end());
    if (speech)
    {
      session_.state = VadState::Active;
      session_.silenceMs = 0;
    }
    else
    {
      session_.silenceMs += frameMs;
    }
    break;

  case VadState::Stopped:
    return std::nullopt;
  }

  if (session_.state == VadState::Silence && session_.silenceMs >= options_.silenceThresholdMs &&
      session_.elapsedMs >= options_.minDurationMs)
  {
    return stop(StopReason::Completed);
  }
  if (session_.elapsedMs >= options_.maxDurationMs)
  {
    return stop(session_.speechSeen ? StopReason::TimedOut : StopReason::Silent);
  }
  return std::nullopt;
}

void SilenceDetector::resume(const std::vector<int16_t> &audio, int sampleRate, long trailingSilenceMs)
{
  sampleRate_ = sampleRate;
  preRoll_.clear();
  session_.buffer = audio;
  session_.elapsedMs = durationMsOf(audio.size(), sampleRate);
  session_.speechSeen = true;
  session_.silenceMs = trailingSilenceMs;
  session_.state = trailingSilenceMs > 0 ? VadState::Silence : VadState::Active;
}

void SilenceDetector::pushPreRoll(const AudioFrame &frame)
{
  const size_t maxPre = samplesFor(frame.sampleRate, options_.preRollMs);
  if (maxPre == 0)
  {
    return;
  }
  preRoll_.insert(preRoll_.end(), frame.samples.begin(), frame.samples.end());
  if (preRoll_.size() > maxPre)
  {
    const size_t extra = preRoll_.size() - maxPre;
    preRoll_.erase(preRoll_.begin(), preRoll_.begin() + static_cast<std::ptrdiff_t>(extra));
  }
}

SessionResult SilenceDetector::stop(StopReason reason)
{
  session_.state = VadState::Stopped;

  SessionResult result;
  result.startedAt = session_.startedAt;
  result.sampleRate = sampleRate_;
  result.elapsedMs = session_.elapsedMs;
  result.reason = reason;
  result.speechDetected = session_.speechSeen;
  if (reason != StopReason::Silent)
  {
    result.audio = std::move(session_.buffer);
  }
  session_.buffer.clear();
  preRoll_.clear();
  return result;
}
