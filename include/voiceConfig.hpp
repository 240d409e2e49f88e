#pragma once

#include "audioCue.hpp"
#include "audioDevice.hpp"
#include "bargeInMonitor.hpp"
#include "configLoader.hpp"
#include "failoverExecutor.hpp"
#include "providerRegistry.hpp"
#include "silenceDetector.hpp"
#include "speechClient.hpp"

#include <map>
#include <string>
#include <vector>

// Everything the engine reads from configuration, resolved and validated
// once at startup.
struct VoiceConfig
{
  std::string logFile = "parley.log";
  std::string logLevel = "info";

  AudioFormat audio;

  std::vector<std::string> ttsBaseUrls;
  std::vector<std::string> sttBaseUrls;
  std::vector<std::string> ttsVoices;
  std::string ttsModel = "tts-1";
  std::string sttModel = "whisper-1";
  double ttsSpeed = 1.0;
  std::string sttLanguage;
  std::vector<AudioEncoding> ttsFormats;
  std::vector<AudioEncoding> sttFormats;
  CompressionPolicy sttCompress = CompressionPolicy::Auto;
  std::string apiKey;
  std::map<std::string, std::string> ttsExtraHeaders;
  std::map<std::string, std::string> sttExtraHeaders;
  HttpTimeouts timeouts;

  int vadAggressiveness = 3;
  ListenOptions listen;

  bool bargeInEnabled = false;
  BargeInOptions bargeIn;

  CueOptions cue;

  bool repeatPhrases = true;
  int maxRepeats = 2;
  std::string lockFile = "~/.parley/conch";

  std::string saveDirectory;
  bool saveAll = false;

  // Throws std::invalid_argument naming the offending key.
  static VoiceConfig load(const ConfigLoader &config);

  // Registers TTS then STT endpoints in configured order.
  void registerEndpoints(ProviderRegistry &registry) const;
};

// First preferred voice the endpoint can speak. Local servers take any
// name; remote ones only the standard OpenAI voices.
std::string selectVoice(const std::vector<std::string> &preferences, bool local);
