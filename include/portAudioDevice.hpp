#pragma once

#include "audioDevice.hpp"
#include "spscRing.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <portaudio.h>

// AudioDevice on PortAudio's default input and output devices. The stream
// callbacks only move samples through lock-free rings; a dispatch thread
// slices captured audio into frames and calls the sink.
class PortAudioDevice : public AudioDevice
{
public:
  PortAudioDevice();
  ~PortAudioDevice() override;

  PortAudioDevice(const PortAudioDevice &) = delete;
  PortAudioDevice &operator=(const PortAudioDevice &) = delete;

  bool isInitialized() const;

  void open(const AudioFormat &format) override;
  void close() override;
  const AudioFormat &format() const override { return format_; }

  void startCapture(FrameSink sink) override;
  void stopCapture() override;
  bool isCapturing() const override { return capturing_.load(); }

  void play(const std::vector<int16_t> &samples, int sampleRate) override;
  bool waitPlayback(std::chrono::milliseconds timeout) override;
  void stopPlayback() override;
  bool isPlaying() const override;
  size_t playedSamples() const override { return playPos_.load(); }

private:
  bool initialized = false;
  bool opened_ = false;
  AudioFormat format_;

  // Capture direction
  std::mutex captureMutex_;
  PaStream *inputStream_ = nullptr;
  std::unique_ptr<SpscRing<int16_t>> captureRing_;
  std::thread dispatchThread_;
  std::atomic<bool> capturing_{false};
  std::atomic<unsigned> overflowCount_{0};
  FrameSink sink_;

  // Playback direction
  std::mutex outputMutex_;
  PaStream *outputStream_ = nullptr;
  std::mutex pendingMutex_;
  std::vector<int16_t> pending_;
  std::atomic<size_t> playPos_{0};
  std::atomic<bool> drained_{true};
  std::atomic<unsigned> underrunCount_{0};

  void negotiateFormat(const AudioFormat &requested);
  void dispatchLoop();
  void joinStaleDispatcher();
  void closeOutputStream(bool abort);

  static int captureCallback(const void *input, void *output, unsigned long frameCount,
                             const PaStreamCallbackTimeInfo *timeInfo, PaStreamCallbackFlags statusFlags,
                             void *userData);
  static int playbackCallback(const void *input, void *output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo *timeInfo, PaStreamCallbackFlags statusFlags,
                              void *userData);
};
