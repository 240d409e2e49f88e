#pragma once

#include "audioFrame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

struct AudioFormat
{
  int sampleRate = 24000;
  int channels = 1;
  int frameMs = 30;

  size_t frameSamples() const { return samplesFor(sampleRate, frameMs); }
};

// Duplex audio: fixed-cadence capture frames into a sink, gapless playback
// of queued buffers. stopCapture() and stopPlayback() may be called from any
// thread, including the capture sink, and are no-ops when already stopped.
class AudioDevice
{
public:
  using FrameSink = std::function<void(const AudioFrame &)>;

  virtual ~AudioDevice() = default;

  // Throws DeviceError when the hardware is unavailable.
  virtual void open(const AudioFormat &format) = 0;
  virtual void close() = 0;
  virtual const AudioFormat &format() const = 0;

  virtual void startCapture(FrameSink sink) = 0;
  virtual void stopCapture() = 0;
  virtual bool isCapturing() const = 0;

  // Queues samples behind anything still playing.
  virtual void play(const std::vector<int16_t> &samples, int sampleRate) = 0;
  // True once everything queued has played or playback was stopped.
  virtual bool waitPlayback(std::chrono::milliseconds timeout) = 0;
  // Cuts playback at the current position and drops the queue.
  virtual void stopPlayback() = 0;
  virtual bool isPlaying() const = 0;
  // Samples rendered since the current playback started.
  virtual size_t playedSamples() const = 0;
};
