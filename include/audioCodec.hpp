#pragma once

#include "providerRegistry.hpp"
#include "wav.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Transcodes between mono 16-bit PCM and a named encoding. Failures throw
// CodecError.
class AudioCodec
{
public:
  virtual ~AudioCodec() = default;

  virtual bool canEncode(AudioEncoding encoding) const = 0;
  virtual bool canDecode(AudioEncoding encoding) const = 0;

  virtual std::vector<uint8_t> encode(const PcmAudio &audio, AudioEncoding encoding) = 0;

  // rawRate is the rate of headerless pcm input.
  virtual PcmAudio decode(const std::vector<uint8_t> &bytes, AudioEncoding encoding, int rawRate) = 0;
};

// wav and pcm are handled in-process; everything else goes through the
// ffmpeg command-line tool when it is on the PATH.
class FfmpegCodec : public AudioCodec
{
public:
  explicit FfmpegCodec(std::string ffmpegPath = "ffmpeg");

  bool canEncode(AudioEncoding encoding) const override;
  bool canDecode(AudioEncoding encoding) const override;

  std::vector<uint8_t> encode(const PcmAudio &audio, AudioEncoding encoding) override;
  PcmAudio decode(const std::vector<uint8_t> &bytes, AudioEncoding encoding, int rawRate) override;

  bool ffmpegAvailable() const;

private:
  std::string ffmpegPath_;
  mutable std::optional<bool> available_;

  std::string runFfmpeg(const std::string &inputPath, const std::string &outputArgs,
                        const std::string &outputExtension) const;
};
