#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct WavHeader
{
  char riff[4] = {'R', 'I', 'F', 'F'};
  uint32_t fileSize;
  char wave[4] = {'W', 'A', 'V', 'E'};
  char fmt[4] = {'f', 'm', 't', ' '};
  uint32_t fmtSize = 16;
  uint16_t audioFormat = 1;
  uint16_t numChannels;
  uint32_t sampleRate;
  uint32_t byteRate;
  uint16_t blockAlign;
  uint16_t bitsPerSample = 16;
  char data[4] = {'d', 'a', 't', 'a'};
  uint32_t dataSize;
} __attribute__((packed));

struct PcmAudio
{
  std::vector<int16_t> samples; // mono
  int sampleRate = 0;
};

std::vector<uint8_t> createWavFromPCM(const std::vector<int16_t> &pcmData, int sampleRate, int channels);

// Parses a 16-bit PCM WAV. Multi-channel input is mixed down to mono.
// Throws std::runtime_error on a malformed or unsupported file.
PcmAudio parseWav(const std::vector<uint8_t> &wavData);

// Raw little-endian 16-bit mono PCM, as returned by response_format=pcm.
PcmAudio pcmFromBytes(const std::vector<uint8_t> &bytes, int sampleRate);

bool writeWavFile(const std::string &path, const std::vector<int16_t> &pcmData, int sampleRate);
