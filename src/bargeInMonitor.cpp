#include "bargeInMonitor.hpp"
#include "AppLogger.hpp"

#include <stdexcept>
#include <string>
#include <utility>

BargeInDetector::BargeInDetector(int minSpeechMs) : minSpeechMs_(minSpeechMs)
{
}

bool BargeInDetector::feed(const AudioFrame &frame, bool speech)
{
  sampleRate_ = frame.sampleRate;
  const int frameMs = frame.durationMs();

  if (triggered_)
  {
    captured_.insert(captured_.end(), frame.samples.begin(), frame.samples.end());
    trailingSilenceMs_ = speech ? 0 : trailingSilenceMs_ + frameMs;
    return false;
  }

  if (!speech)
  {
    // No partial credit: the run has to be continuous.
    speechMs_ = 0;
    captured_.clear();
    return false;
  }

  speechMs_ += frameMs;
  captured_.insert(captured_.end(), frame.samples.begin(), frame.samples.end());
  if (speechMs_ >= minSpeechMs_)
  {
    triggered_ = true;
    return true;
  }
  return false;
}

void BargeInDetector::reset()
{
  triggered_ = false;
  speechMs_ = 0;
  trailingSilenceMs_ = 0;
  captured_.clear();
}

BargeInMonitor::BargeInMonitor(AudioDevice &device, VoiceActivityClassifier &classifier, BargeInOptions options)
    : device_(device), classifier_(classifier), options_(options), detector_(options.minSpeechMs)
{
}

BargeInMonitor::~BargeInMonitor()
{
  stop();
}

void BargeInMonitor::start(std::function<void()> onVoiceDetected)
{
  if (monitoring_.load())
  {
    throw std::logic_error("barge-in monitoring is already active");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    detector_.reset();
    listener_ = nullptr;
    onResult_ = nullptr;
    onError_ = nullptr;
    onVoiceDetected_ = std::move(onVoiceDetected);
    disarmed_ = false;
  }
  triggered_.store(false);

  AppLogger::getInstance().info("BARGE_IN_START vad=" + std::to_string(options_.vadAggressiveness) +
                                " min_speech=" + std::to_string(options_.minSpeechMs) + "ms");

  monitoring_.store(true);
  try
  {
    device_.startCapture([this](const AudioFrame &frame) { onFrame(frame); });
  }
  catch (...)
  {
    monitoring_.store(false);
    throw;
  }
}

void BargeInMonitor::stop()
{
  if (!monitoring_.exchange(false))
  {
    return;
  }
  device_.stopCapture();
  AppLogger::getInstance().info(std::string("BARGE_IN_STOP voice_detected=") + (triggered_.load() ? "true" : "false"));
}

bool BargeInMonitor::disarm()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!detector_.triggered())
  {
    disarmed_ = true;
  }
  return detector_.triggered();
}

std::vector<int16_t> BargeInMonitor::capturedAudio() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!detector_.triggered())
  {
    return {};
  }
  return detector_.captured();
}

void BargeInMonitor::handOff(SilenceDetector &listener, ResultCallback onResult, ErrorCallback onError)
{
  std::lock_guard<std::mutex> lock(mutex_);
  listener.resume(detector_.captured(), detector_.sampleRate(), detector_.trailingSilenceMs());
  listener_ = &listener;
  onResult_ = std::move(onResult);
  onError_ = std::move(onError);
  AppLogger::getInstance().debug("Barge-in audio handed to listener: " +
                                 std::to_string(detector_.captured().size()) + " samples");
}

void BargeInMonitor::onFrame(const AudioFrame &frame)
{
  std::unique_lock<std::mutex> lock(mutex_);

  if (listener_)
  {
    std::optional<SessionResult> result;
    try
    {
      result = listener_->feed(frame);
    }
    catch (const std::exception &e)
    {
      AppLogger::getInstance().error(std::string("Listening after barge-in failed: ") + e.what());
      ErrorCallback onError = std::move(onError_);
      listener_ = nullptr;
      onResult_ = nullptr;
      disarmed_ = true;
      lock.unlock();
      if (!onError)
      {
        throw;
      }
      onError(std::current_exception());
      return;
    }
    if (result)
    {
      ResultCallback callback = std::move(onResult_);
      listener_ = nullptr;
      lock.unlock();
      if (callback)
      {
        callback(std::move(*result));
      }
    }
    return;
  }

  if (disarmed_)
  {
    return;
  }

  if (detector_.triggered())
  {
    detector_.feed(frame, classifier_.isSpeech(frame));
    return;
  }

  if (!detector_.feed(frame, classifier_.isSpeech(frame)))
  {
    return;
  }

  triggered_.store(true);
  AppLogger::getInstance().info("BARGE_IN_DETECTED after " + std::to_string(detector_.speechMs()) + "ms of speech");
  std::function<void()> callback = onVoiceDetected_;
  lock.unlock();

  if (callback)
  {
    callback();
  }
}
