#include "audioCodec.hpp"
#include "AppLogger.hpp"
#include "errors.hpp"
#include "speechClient.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <unistd.h>

namespace
{

std::filesystem::path tempPath(const std::string &extension)
{
  static std::atomic<unsigned> counter{0};
  return std::filesystem::temp_directory_path() /
         ("parley_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "." + extension);
}

// Removes the file when it goes out of scope.
struct TempFile
{
  std::filesystem::path path;

  explicit TempFile(std::filesystem::path p) : path(std::move(p)) {}
  ~TempFile()
  {
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
};

void writeBytes(const std::filesystem::path &path, const std::vector<uint8_t> &bytes)
{
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw CodecError("cannot write " + path.string());
  }
  file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<uint8_t> readBytes(const std::filesystem::path &path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw CodecError("cannot read " + path.string());
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

const char *ffmpegOutputArgs(AudioEncoding encoding)
{
  switch (encoding)
  {
  case AudioEncoding::Mp3:
    return "-codec:a libmp3lame -b:a 64k -f mp3";
  case AudioEncoding::Opus:
    return "-codec:a libopus -b:a 32k -f ogg";
  case AudioEncoding::Aac:
    return "-codec:a aac -b:a 64k -f adts";
  case AudioEncoding::Flac:
    return "-codec:a flac -f flac";
  default:
    return "";
  }
}

}

FfmpegCodec::FfmpegCodec(std::string ffmpegPath) : ffmpegPath_(std::move(ffmpegPath))
{
}

bool FfmpegCodec::ffmpegAvailable() const
{
  if (!available_)
  {
    std::string command = ffmpegPath_ + " -hide_banner -version >/dev/null 2>&1";
    available_ = std::system(command.c_str()) == 0;
    if (!*available_)
    {
      AppLogger::getInstance().warn("ffmpeg not found; compressed audio formats are disabled.");
    }
  }
  return *available_;
}

bool FfmpegCodec::canEncode(AudioEncoding encoding) const
{
  return !isCompressed(encoding) || ffmpegAvailable();
}

bool FfmpegCodec::canDecode(AudioEncoding encoding) const
{
  return canEncode(encoding);
}

std::vector<uint8_t> FfmpegCodec::encode(const PcmAudio &audio, AudioEncoding encoding)
{
  if (encoding == AudioEncoding::Pcm)
  {
    const uint8_t *bytes = reinterpret_cast<const uint8_t *>(audio.samples.data());
    return std::vector<uint8_t>(bytes, bytes + audio.samples.size() * sizeof(int16_t));
  }

  std::vector<uint8_t> wav = createWavFromPCM(audio.samples, audio.sampleRate, 1);
  if (encoding == AudioEncoding::Wav)
  {
    return wav;
  }

  if (!ffmpegAvailable())
  {
    throw CodecError(std::string("no encoder for ") + toString(encoding));
  }

  TempFile input(tempPath("wav"));
  writeBytes(input.path, wav);
  TempFile output(runFfmpeg(input.path.string(), ffmpegOutputArgs(encoding), fileExtensionFor(encoding)));
  std::vector<uint8_t> encoded = readBytes(output.path);

  AppLogger::getInstance().debug("Encoded " + std::to_string(wav.size()) + " wav bytes to " +
                                 std::to_string(encoded.size()) + " " + toString(encoding) + " bytes");
  return encoded;
}

PcmAudio FfmpegCodec::decode(const std::vector<uint8_t> &bytes, AudioEncoding encoding, int rawRate)
{
  if (encoding == AudioEncoding::Pcm)
  {
    return pcmFromBytes(bytes, rawRate);
  }

  if (encoding == AudioEncoding::Wav)
  {
    try
    {
      return parseWav(bytes);
    }
    catch (const std::runtime_error &e)
    {
      throw CodecError(std::string("invalid wav: ") + e.what());
    }
  }

  if (!ffmpegAvailable())
  {
    throw CodecError(std::string("no decoder for ") + toString(encoding));
  }

  TempFile input(tempPath(fileExtensionFor(encoding)));
  writeBytes(input.path, bytes);
  TempFile output(runFfmpeg(input.path.string(), "-ac 1 -codec:a pcm_s16le -f wav", "wav"));
  try
  {
    return parseWav(readBytes(output.path));
  }
  catch (const std::runtime_error &e)
  {
    throw CodecError(std::string("ffmpeg produced invalid wav: ") + e.what());
  }
}

std::string FfmpegCodec::runFfmpeg(const std::string &inputPath, const std::string &outputArgs,
                                   const std::string &outputExtension) const
{
  std::string outputPath = tempPath(outputExtension).string();
  std::string command = ffmpegPath_ + " -hide_banner -loglevel error -y -i \"" + inputPath + "\" " + outputArgs +
                        " \"" + outputPath + "\" 2>/dev/null";
  if (std::system(command.c_str()) != 0)
  {
    std::error_code ec;
    std::filesystem::remove(outputPath, ec);
    throw CodecError("ffmpeg failed: " + command);
  }
  return outputPath;
}
