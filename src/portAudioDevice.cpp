#include "portAudioDevice.hpp"
#include "AppLogger.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace
{
// Seconds of audio the capture ring holds before the dispatcher falls behind.
constexpr int kCaptureRingSeconds = 2;

std::string paError(const std::string &what, PaError err)
{
  return what + ": " + Pa_GetErrorText(err);
}
}

PortAudioDevice::PortAudioDevice()
{
  PaError err = Pa_Initialize();
  if (err == paNoError)
  {
    initialized = true;
    AppLogger::getInstance().info("PortAudio initialized successfully.");
  }
  else
  {
    AppLogger::getInstance().error(paError("PortAudio initialization failed", err));
  }
}

PortAudioDevice::~PortAudioDevice()
{
  close();
  if (initialized)
  {
    PaError err = Pa_Terminate();
    if (err != paNoError)
    {
      AppLogger::getInstance().warn(paError("PortAudio termination failed", err));
    }
  }
}

bool PortAudioDevice::isInitialized() const
{
  return initialized;
}

void PortAudioDevice::negotiateFormat(const AudioFormat &requested)
{
  PaDeviceIndex inputDevice = Pa_GetDefaultInputDevice();
  PaDeviceIndex outputDevice = Pa_GetDefaultOutputDevice();
  if (inputDevice == paNoDevice)
  {
    throw DeviceError("no default input device");
  }
  if (outputDevice == paNoDevice)
  {
    throw DeviceError("no default output device");
  }

  const PaDeviceInfo *inputInfo = Pa_GetDeviceInfo(inputDevice);
  const PaDeviceInfo *outputInfo = Pa_GetDeviceInfo(outputDevice);

  PaStreamParameters inParams{};
  inParams.device = inputDevice;
  inParams.channelCount = 1;
  inParams.sampleFormat = paInt16;
  inParams.suggestedLatency = inputInfo ? inputInfo->defaultLowInputLatency : 0.05;

  PaStreamParameters outParams{};
  outParams.device = outputDevice;
  outParams.channelCount = 1;
  outParams.sampleFormat = paInt16;
  outParams.suggestedLatency = outputInfo ? outputInfo->defaultLowOutputLatency : 0.05;

  format_ = requested;
  format_.channels = 1;

  PaError err = Pa_IsFormatSupported(&inParams, &outParams, format_.sampleRate);
  if (err != paFormatIsSupported && inputInfo)
  {
    const int fallbackRate = static_cast<int>(inputInfo->defaultSampleRate);
    AppLogger::getInstance().warn(paError("Sample rate " + std::to_string(format_.sampleRate) +
                                              "Hz not supported, trying device default " +
                                              std::to_string(fallbackRate) + "Hz",
                                          err));
    format_.sampleRate = fallbackRate;
    err = Pa_IsFormatSupported(&inParams, &outParams, format_.sampleRate);
  }
  if (err != paFormatIsSupported)
  {
    throw DeviceError(paError("audio device rejected 16-bit mono at " + std::to_string(format_.sampleRate) + "Hz", err));
  }

  AppLogger::getInstance().info(std::string("Audio device: in=") + (inputInfo ? inputInfo->name : "(unknown)") +
                                ", out=" + (outputInfo ? outputInfo->name : "(unknown)") + ", " +
                                std::to_string(format_.sampleRate) + "Hz, " + std::to_string(format_.frameMs) +
                                "ms frames");
}

void PortAudioDevice::open(const AudioFormat &format)
{
  if (!initialized)
  {
    throw DeviceError("PortAudio not initialized");
  }
  if (opened_)
  {
    return;
  }

  negotiateFormat(format);
  captureRing_ = std::make_unique<SpscRing<int16_t>>(static_cast<size_t>(format_.sampleRate) * kCaptureRingSeconds);
  opened_ = true;
}

void PortAudioDevice::close()
{
  stopCapture();
  joinStaleDispatcher();
  stopPlayback();
  opened_ = false;
}

// ---------------- Capture ----------------

int PortAudioDevice::captureCallback(const void *input, void *, unsigned long frameCount,
                                     const PaStreamCallbackTimeInfo *, PaStreamCallbackFlags statusFlags,
                                     void *userData)
{
  auto *self = static_cast<PortAudioDevice *>(userData);
  if (statusFlags & paInputOverflow)
  {
    self->overflowCount_.fetch_add(1);
  }
  if (input)
  {
    const size_t pushed = self->captureRing_->push(static_cast<const int16_t *>(input), frameCount);
    if (pushed < frameCount)
    {
      self->overflowCount_.fetch_add(1);
    }
  }
  return paContinue;
}

void PortAudioDevice::joinStaleDispatcher()
{
  std::thread stale;
  {
    std::lock_guard<std::mutex> lock(captureMutex_);
    if (dispatchThread_.joinable() && dispatchThread_.get_id() != std::this_thread::get_id())
    {
      stale = std::move(dispatchThread_);
    }
  }
  if (stale.joinable())
  {
    stale.join();
  }
}

void PortAudioDevice::startCapture(FrameSink sink)
{
  if (!opened_)
  {
    throw DeviceError("audio device not open");
  }

  // A sink that stopped capture from inside the dispatcher leaves it to us to join.
  joinStaleDispatcher();

  std::lock_guard<std::mutex> lock(captureMutex_);
  if (inputStream_)
  {
    throw DeviceError("capture already running");
  }

  captureRing_->clear();
  overflowCount_.store(0);
  sink_ = std::move(sink);

  PaStream *stream = nullptr;
  PaError err = Pa_OpenDefaultStream(&stream,
                                     1,
                                     0,
                                     paInt16,
                                     format_.sampleRate,
                                     format_.frameSamples(),
                                     &PortAudioDevice::captureCallback,
                                     this);
  if (err != paNoError)
  {
    throw DeviceError(paError("error opening capture stream", err));
  }

  err = Pa_StartStream(stream);
  if (err != paNoError)
  {
    Pa_CloseStream(stream);
    throw DeviceError(paError("error starting capture stream", err));
  }

  inputStream_ = stream;
  capturing_.store(true);
  dispatchThread_ = std::thread(&PortAudioDevice::dispatchLoop, this);
  AppLogger::getInstance().debug("Capture started");
}

void PortAudioDevice::dispatchLoop()
{
  const size_t frameSamples = format_.frameSamples();
  std::vector<int16_t> scratch(frameSamples);
  unsigned reportedOverflows = 0;

  while (capturing_.load())
  {
    if (captureRing_->available() < frameSamples)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      continue;
    }

    captureRing_->pop(scratch.data(), frameSamples);
    AudioFrame frame(scratch, format_.sampleRate);

    const unsigned overflows = overflowCount_.load();
    if (overflows != reportedOverflows)
    {
      AppLogger::getInstance().warn("Capture overrun (" + std::to_string(overflows - reportedOverflows) +
                                    " since last frame), continuing");
      reportedOverflows = overflows;
    }

    try
    {
      sink_(frame);
    }
    catch (const std::exception &e)
    {
      AppLogger::getInstance().error(std::string("Capture sink failed, stopping capture: ") + e.what());
      capturing_.store(false);
    }
  }
}

void PortAudioDevice::stopCapture()
{
  capturing_.store(false);

  PaStream *stream = nullptr;
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(captureMutex_);
    stream = inputStream_;
    inputStream_ = nullptr;
    if (dispatchThread_.joinable() && dispatchThread_.get_id() != std::this_thread::get_id())
    {
      worker = std::move(dispatchThread_);
    }
  }

  if (stream)
  {
    PaError err = Pa_StopStream(stream);
    if (err != paNoError)
    {
      AppLogger::getInstance().warn(paError("error stopping capture stream", err));
    }
    err = Pa_CloseStream(stream);
    if (err != paNoError)
    {
      AppLogger::getInstance().warn(paError("error closing capture stream", err));
    }
    AppLogger::getInstance().debug("Capture stopped");
  }

  if (worker.joinable())
  {
    worker.join();
  }
}

// ---------------- Playback ----------------

int PortAudioDevice::playbackCallback(const void *, void *output, unsigned long frameCount,
                                      const PaStreamCallbackTimeInfo *, PaStreamCallbackFlags statusFlags,
                                      void *userData)
{
  auto *self = static_cast<PortAudioDevice *>(userData);
  auto *out = static_cast<int16_t *>(output);
  size_t written = 0;

  if (statusFlags & paOutputUnderflow)
  {
    self->underrunCount_.fetch_add(1);
  }

  // Never block the audio thread; a contended buffer costs one period of silence.
  std::unique_lock<std::mutex> lock(self->pendingMutex_, std::try_to_lock);
  if (lock.owns_lock())
  {
    const size_t pos = self->playPos_.load();
    const size_t remaining = self->pending_.size() > pos ? self->pending_.size() - pos : 0;
    written = std::min<size_t>(remaining, frameCount);
    if (written > 0)
    {
      std::memcpy(out, self->pending_.data() + pos, written * sizeof(int16_t));
      self->playPos_.store(pos + written);
    }
    if (pos + written >= self->pending_.size())
    {
      self->drained_.store(true);
    }
  }
  else if (!self->drained_.load())
  {
    self->underrunCount_.fetch_add(1);
  }

  if (written < frameCount)
  {
    std::memset(out + written, 0, (frameCount - written) * sizeof(int16_t));
  }
  return paContinue;
}

void PortAudioDevice::play(const std::vector<int16_t> &samples, int sampleRate)
{
  if (!opened_)
  {
    throw DeviceError("audio device not open");
  }
  if (samples.empty())
  {
    return;
  }

  std::vector<int16_t> converted;
  const std::vector<int16_t> *source = &samples;
  if (sampleRate != format_.sampleRate)
  {
    converted = resampleLinear(samples, sampleRate, format_.sampleRate);
    source = &converted;
  }

  std::lock_guard<std::mutex> outputLock(outputMutex_);
  {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    if (!outputStream_)
    {
      pending_.clear();
      playPos_.store(0);
      underrunCount_.store(0);
    }
    pending_.insert(pending_.end(), source->begin(), source->end());
    drained_.store(false);
  }

  if (outputStream_)
  {
    return;
  }

  PaStream *stream = nullptr;
  PaError err = Pa_OpenDefaultStream(&stream,
                                     0,
                                     1,
                                     paInt16,
                                     format_.sampleRate,
                                     format_.frameSamples(),
                                     &PortAudioDevice::playbackCallback,
                                     this);
  if (err != paNoError)
  {
    throw DeviceError(paError("error opening playback stream", err));
  }

  err = Pa_StartStream(stream);
  if (err != paNoError)
  {
    Pa_CloseStream(stream);
    throw DeviceError(paError("error starting playback stream", err));
  }
  outputStream_ = stream;
}

bool PortAudioDevice::waitPlayback(std::chrono::milliseconds timeout)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline)
  {
    {
      std::lock_guard<std::mutex> lock(outputMutex_);
      if (!outputStream_)
      {
        return true;
      }
    }
    if (drained_.load())
    {
      // Pa_StopStream lets the last hardware buffers play out.
      closeOutputStream(false);
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

void PortAudioDevice::closeOutputStream(bool abort)
{
  std::lock_guard<std::mutex> outputLock(outputMutex_);
  if (!outputStream_)
  {
    return;
  }

  PaError err = abort ? Pa_AbortStream(outputStream_) : Pa_StopStream(outputStream_);
  if (err != paNoError)
  {
    AppLogger::getInstance().warn(paError("error stopping playback stream", err));
  }
  err = Pa_CloseStream(outputStream_);
  if (err != paNoError)
  {
    AppLogger::getInstance().warn(paError("error closing playback stream", err));
  }
  outputStream_ = nullptr;

  const unsigned underruns = underrunCount_.load();
  if (underruns > 0)
  {
    AppLogger::getInstance().warn("Playback had " + std::to_string(underruns) + " underrun(s)");
  }

  std::lock_guard<std::mutex> lock(pendingMutex_);
  pending_.clear();
  drained_.store(true);
}

void PortAudioDevice::stopPlayback()
{
  closeOutputStream(true);
}

bool PortAudioDevice::isPlaying() const
{
  return !drained_.load();
}
