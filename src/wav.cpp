#include "wav.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>

std::vector<uint8_t> createWavFromPCM(const std::vector<int16_t> &pcmData, int sampleRate, int channels)
{
  WavHeader header;
  header.numChannels = static_cast<uint16_t>(channels);
  header.sampleRate = static_cast<uint32_t>(sampleRate);
  header.byteRate = static_cast<uint32_t>(sampleRate * channels * 2);
  header.blockAlign = static_cast<uint16_t>(channels * 2);

  uint32_t dataSize = static_cast<uint32_t>(pcmData.size() * sizeof(int16_t));
  header.dataSize = dataSize;
  header.fileSize = sizeof(WavHeader) - 8 + dataSize;

  std::vector<uint8_t> wavData;
  wavData.reserve(sizeof(WavHeader) + dataSize);

  wavData.resize(sizeof(WavHeader));
  std::memcpy(wavData.data(), &header, sizeof(WavHeader));

  const uint8_t *pcmBytes = reinterpret_cast<const uint8_t *>(pcmData.data());
  wavData.insert(wavData.end(), pcmBytes, pcmBytes + dataSize);

  return wavData;
}

namespace
{
uint16_t readU16(const uint8_t *p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t *p)
{
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}
}

PcmAudio parseWav(const std::vector<uint8_t> &wavData)
{
  if (wavData.size() < 44)
  {
    throw std::runtime_error("audio data too small to contain a WAV header");
  }

  const uint8_t *header = wavData.data();
  if (std::memcmp(header, "RIFF", 4) != 0 || std::memcmp(header + 8, "WAVE", 4) != 0)
  {
    throw std::runtime_error("invalid WAV signature");
  }

  uint16_t numChannels = 0;
  uint32_t wavSampleRate = 0;
  uint16_t bitsPerSample = 0;
  size_t dataOffset = 0;
  size_t dataSize = 0;

  // Walk the chunk list; servers sometimes add LIST chunks before data.
  size_t pos = 12;
  while (pos + 8 <= wavData.size())
  {
    const uint8_t *chunk = header + pos;
    uint32_t chunkSize = readU32(chunk + 4);
    if (std::memcmp(chunk, "fmt ", 4) == 0 && pos + 8 + 16 <= wavData.size())
    {
      numChannels = readU16(chunk + 10);
      wavSampleRate = readU32(chunk + 12);
      bitsPerSample = readU16(chunk + 22);
    }
    else if (std::memcmp(chunk, "data", 4) == 0)
    {
      dataOffset = pos + 8;
      // Streamed WAVs carry 0 or 0xFFFFFFFF as the data size.
      size_t available = wavData.size() - dataOffset;
      dataSize = (chunkSize == 0 || chunkSize > available) ? available : chunkSize;
      break;
    }
    pos += 8 + chunkSize + (chunkSize & 1);
  }

  if (dataOffset == 0)
  {
    throw std::runtime_error("could not find data chunk in WAV file");
  }
  if (bitsPerSample != 16 || numChannels == 0 || wavSampleRate == 0)
  {
    throw std::runtime_error("unsupported WAV format: " + std::to_string(bitsPerSample) + " bits, " +
                             std::to_string(numChannels) + " channels");
  }

  PcmAudio audio;
  audio.sampleRate = static_cast<int>(wavSampleRate);
  const size_t frames = dataSize / (2u * numChannels);
  audio.samples.resize(frames);
  const uint8_t *pcm = header + dataOffset;
  for (size_t i = 0; i < frames; ++i)
  {
    int sum = 0;
    for (uint16_t c = 0; c < numChannels; ++c)
    {
      sum += static_cast<int16_t>(readU16(pcm + (i * numChannels + c) * 2));
    }
    audio.samples[i] = static_cast<int16_t>(sum / numChannels);
  }
  return audio;
}

PcmAudio pcmFromBytes(const std::vector<uint8_t> &bytes, int sampleRate)
{
  PcmAudio audio;
  audio.sampleRate = sampleRate;
  audio.samples.resize(bytes.size() / 2);
  for (size_t i = 0; i < audio.samples.size(); ++i)
  {
    audio.samples[i] = static_cast<int16_t>(readU16(bytes.data() + i * 2));
  }
  return audio;
}

bool writeWavFile(const std::string &path, const std::vector<int16_t> &pcmData, int sampleRate)
{
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    return false;
  }
  std::vector<uint8_t> wavData = createWavFromPCM(pcmData, sampleRate, 1);
  file.write(reinterpret_cast<const char *>(wavData.data()), static_cast<std::streamsize>(wavData.size()));
  return static_cast<bool>(file);
}
