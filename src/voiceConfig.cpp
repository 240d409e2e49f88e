#include "voiceConfig.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace
{

const std::vector<std::string> OPENAI_VOICES = {"alloy", "ash", "ballad", "coral", "echo", "fable",
                                                "nova", "onyx", "sage", "shimmer", "verse"};

void require(bool condition, const std::string &key, const std::string &message)
{
  if (!condition)
  {
    throw std::invalid_argument("config: " + key + " " + message);
  }
}

std::vector<AudioEncoding> encodingList(const ConfigLoader &config, const std::string &key,
                                        const std::string &defaultValue)
{
  std::vector<AudioEncoding> encodings;
  for (const std::string &name : config.getList(key, defaultValue))
  {
    std::optional<AudioEncoding> encoding = parseEncoding(name);
    require(encoding.has_value(), key, "has unknown audio format '" + name + "'");
    encodings.push_back(*encoding);
  }
  require(!encodings.empty(), key, "must list at least one audio format");
  return encodings;
}

int secondsToMs(float seconds)
{
  return static_cast<int>(std::lround(seconds * 1000.0f));
}

}

std::string selectVoice(const std::vector<std::string> &preferences, bool local)
{
  if (local)
  {
    return preferences.empty() ? "af_sky" : preferences.front();
  }
  for (const std::string &voice : preferences)
  {
    if (std::find(OPENAI_VOICES.begin(), OPENAI_VOICES.end(), voice) != OPENAI_VOICES.end())
    {
      return voice;
    }
  }
  return "alloy";
}

VoiceConfig VoiceConfig::load(const ConfigLoader &config)
{
  VoiceConfig vc;

  vc.logFile = config.getString("log.file", vc.logFile);
  vc.logLevel = config.getString("log.level", vc.logLevel);

  vc.audio.sampleRate = config.getInt("audio.sampleRate", vc.audio.sampleRate);
  vc.audio.frameMs = config.getInt("audio.frameMs", vc.audio.frameMs);
  require(vc.audio.sampleRate >= 8000 && vc.audio.sampleRate <= 48000, "audio.sampleRate",
          "must be between 8000 and 48000");
  require(vc.audio.frameMs == 10 || vc.audio.frameMs == 20 || vc.audio.frameMs == 30, "audio.frameMs",
          "must be 10, 20 or 30");

  vc.ttsBaseUrls = config.getList("tts.baseUrls", "http://127.0.0.1:8880/v1,https://api.openai.com/v1");
  vc.sttBaseUrls = config.getList("stt.baseUrls", "http://127.0.0.1:2022/v1,https://api.openai.com/v1");
  require(!vc.ttsBaseUrls.empty(), "tts.baseUrls", "must list at least one endpoint");
  require(!vc.sttBaseUrls.empty(), "stt.baseUrls", "must list at least one endpoint");
  for (const std::string &url : vc.ttsBaseUrls)
  {
    try
    {
      parseBaseUrl(url);
    }
    catch (const std::invalid_argument &e)
    {
      require(false, "tts.baseUrls", e.what());
    }
  }
  for (const std::string &url : vc.sttBaseUrls)
  {
    try
    {
      parseBaseUrl(url);
    }
    catch (const std::invalid_argument &e)
    {
      require(false, "stt.baseUrls", e.what());
    }
  }

  vc.ttsVoices = config.getList("tts.voices", "af_sky,alloy");
  vc.ttsModel = config.getString("tts.model", vc.ttsModel);
  vc.sttModel = config.getString("stt.model", vc.sttModel);
  vc.ttsSpeed = config.getFloat("tts.speed", 1.0f);
  require(vc.ttsSpeed >= 0.25 && vc.ttsSpeed <= 4.0, "tts.speed", "must be between 0.25 and 4.0");
  vc.sttLanguage = config.getString("stt.language", "");
  vc.ttsFormats = encodingList(config, "tts.formats", "pcm,wav,mp3,opus");
  vc.sttFormats = encodingList(config, "stt.formats", "wav,mp3");

  std::string compress = config.getString("stt.compress", "auto");
  std::optional<CompressionPolicy> policy = parseCompressionPolicy(compress);
  require(policy.has_value(), "stt.compress", "must be auto, always or never");
  vc.sttCompress = *policy;

  vc.apiKey = config.getString("openai.apiKey", "");
  if (vc.apiKey.empty())
  {
    const char *key = std::getenv("OPENAI_API_KEY");
    vc.apiKey = key ? key : "";
  }
  vc.ttsExtraHeaders = ConfigLoader::parseHeaders(config.getString("tts.extraHeaders", ""));
  vc.sttExtraHeaders = ConfigLoader::parseHeaders(config.getString("stt.extraHeaders", ""));
  vc.timeouts.connectMs = config.getInt("providers.connectTimeoutMs", vc.timeouts.connectMs);
  vc.timeouts.readMs = config.getInt("providers.readTimeoutMs", vc.timeouts.readMs);
  require(vc.timeouts.connectMs > 0, "providers.connectTimeoutMs", "must be positive");
  require(vc.timeouts.readMs > 0, "providers.readTimeoutMs", "must be positive");

  vc.vadAggressiveness = config.getInt("vad.aggressiveness", vc.vadAggressiveness);
  require(vc.vadAggressiveness >= 0 && vc.vadAggressiveness <= 3, "vad.aggressiveness", "must be 0-3");

  vc.listen.silenceThresholdMs = config.getInt("listen.silenceThresholdMs", vc.listen.silenceThresholdMs);
  vc.listen.minDurationMs = secondsToMs(config.getFloat("listen.minDurationSeconds", 0.5f));
  vc.listen.maxDurationMs = secondsToMs(config.getFloat("listen.maxDurationSeconds", 120.0f));
  vc.listen.initialGraceMs = secondsToMs(config.getFloat("listen.initialGraceSeconds", 4.0f));
  vc.listen.preRollMs = config.getInt("listen.preRollMs", vc.listen.preRollMs);
  require(vc.listen.silenceThresholdMs > 0, "listen.silenceThresholdMs", "must be positive");
  require(vc.listen.maxDurationMs > 0, "listen.maxDurationSeconds", "must be positive");
  require(vc.listen.minDurationMs >= 0 && vc.listen.minDurationMs <= vc.listen.maxDurationMs,
          "listen.minDurationSeconds", "must be between 0 and listen.maxDurationSeconds");
  require(vc.listen.initialGraceMs >= 0, "listen.initialGraceSeconds", "must not be negative");
  require(vc.listen.preRollMs >= 0, "listen.preRollMs", "must not be negative");

  vc.bargeInEnabled = config.getBool("bargeIn.enabled", vc.bargeInEnabled);
  vc.bargeIn.vadAggressiveness = config.getInt("bargeIn.vadAggressiveness", vc.bargeIn.vadAggressiveness);
  vc.bargeIn.minSpeechMs = config.getInt("bargeIn.minSpeechMs", vc.bargeIn.minSpeechMs);
  require(vc.bargeIn.vadAggressiveness >= 0 && vc.bargeIn.vadAggressiveness <= 3, "bargeIn.vadAggressiveness",
          "must be 0-3");
  require(vc.bargeIn.minSpeechMs > 0, "bargeIn.minSpeechMs", "must be positive");

  vc.cue.enabled = config.getBool("cue.enabled", vc.cue.enabled);
  vc.cue.leadSilenceMs = config.getInt("cue.leadSilenceMs", vc.cue.leadSilenceMs);
  vc.cue.trailSilenceMs = config.getInt("cue.trailSilenceMs", vc.cue.trailSilenceMs);
  require(vc.cue.leadSilenceMs >= 0 && vc.cue.trailSilenceMs >= 0, "cue.leadSilenceMs",
          "cue padding must not be negative");

  vc.repeatPhrases = config.getBool("conversation.repeatPhrases", vc.repeatPhrases);
  vc.maxRepeats = config.getInt("conversation.maxRepeats", vc.maxRepeats);
  require(vc.maxRepeats >= 0, "conversation.maxRepeats", "must not be negative");
  vc.lockFile = config.getString("conversation.lockFile", vc.lockFile);

  vc.saveDirectory = config.getString("audio.saveDirectory", "");
  vc.saveAll = config.getBool("audio.saveAll", vc.saveAll);

  return vc;
}

void VoiceConfig::registerEndpoints(ProviderRegistry &registry) const
{
  for (const std::string &url : ttsBaseUrls)
  {
    EndpointSpec spec;
    spec.kind = ProviderKind::Tts;
    spec.baseUrl = url;
    spec.model = ttsModel;
    spec.voice = selectVoice(ttsVoices, isLocalUrl(url));
    spec.encodings = ttsFormats;
    spec.apiKey = isLocalUrl(url) ? "" : apiKey;
    spec.extraHeaders = ttsExtraHeaders;
    registry.add(spec);
  }
  for (const std::string &url : sttBaseUrls)
  {
    EndpointSpec spec;
    spec.kind = ProviderKind::Stt;
    spec.baseUrl = url;
    spec.model = sttModel;
    spec.language = sttLanguage;
    spec.encodings = sttFormats;
    spec.apiKey = isLocalUrl(url) ? "" : apiKey;
    spec.extraHeaders = sttExtraHeaders;
    registry.add(spec);
  }
}
