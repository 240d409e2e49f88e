#include "AppLogger.hpp"
#include "audioCodec.hpp"
#include "configLoader.hpp"
#include "conversation.hpp"
#include "failoverExecutor.hpp"
#include "portAudioDevice.hpp"
#include "providerRegistry.hpp"
#include "speechClient.hpp"
#include "voiceConfig.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <stdexcept>
#include <utility>

void speak_error(const std::string &message)
{
  std::string command = "espeak-ng -v en-US+f3 -s 150 \"" + message + "\" 2>/dev/null";
  AppLogger::getInstance().info("speaking error: \"" + message + "\"");
  if (std::system(command.c_str()) != 0)
  {
    AppLogger::getInstance().error("failed to execute espeak-ng command. Is espeak-ng installed?");
  }
}

void log_provider_health(FailoverExecutor &executor)
{
  AppLogger::getInstance().info("Checking speech provider connectivity...");
  int reachable = 0;
  const auto results = executor.probeAll();
  for (const auto &result : results)
  {
    if (result.second == EndpointStatus::Ok)
    {
      reachable++;
    }
    AppLogger::getInstance().info(std::string(toString(result.first->kind)) + " " + result.first->baseUrl + ": " +
                                  toString(result.second));
  }
  if (reachable == 0)
  {
    AppLogger::getInstance().error("No speech provider is reachable.");
    speak_error("No speech provider is reachable.");
  }
}

int main(int argc, char **argv)
{
  if (argc < 2 || argc > 3)
  {
    std::cerr << "usage: " << argv[0] << " [config-file] \"text to speak\"" << std::endl;
    return 2;
  }
  const std::string configPath = argc == 3 ? argv[1] : "parley.conf";
  const std::string text = argv[argc - 1];

  ConfigLoader config;
  if (!config.loadFromFile(configPath))
  {
    std::cerr << "Using built-in defaults." << std::endl;
  }

  VoiceConfig voiceConfig;
  try
  {
    voiceConfig = VoiceConfig::load(config);
  }
  catch (const std::invalid_argument &e)
  {
    std::cerr << e.what() << std::endl;
    speak_error("Configuration file is invalid.");
    return 1;
  }

  AppLogger::getInstance().open(voiceConfig.logFile);
  AppLogger::getInstance().setLevel(AppLogger::parseLevel(voiceConfig.logLevel, LogLevel::Info));
  AppLogger::getInstance().info("parley starting...");

  if (!voiceConfig.saveDirectory.empty())
  {
    std::error_code ec_dir;
    std::filesystem::create_directories(voiceConfig.saveDirectory, ec_dir);
    if (ec_dir)
    {
      AppLogger::getInstance().error("Failed to create audio directory: " + ec_dir.message());
      speak_error("Failed to create audio directory. Check permissions.");
    }
  }

  try
  {
    ProviderRegistry registry;
    voiceConfig.registerEndpoints(registry);

    HttpSpeechClient client(voiceConfig.timeouts);
    FfmpegCodec codec;
    FailoverExecutor executor(registry, client, codec, voiceConfig.sttCompress);
    log_provider_health(executor);

    ConversationOrchestrator orchestrator(voiceConfig, executor, []() {
      auto device = std::make_unique<PortAudioDevice>();
      if (!device->isInitialized())
      {
        throw DeviceError("PortAudio initialization failed");
      }
      return std::unique_ptr<AudioDevice>(std::move(device));
    });

    ConverseRequest request;
    request.text = text;
    request.waitForResponse = true;

    ConversationExchange exchange = orchestrator.converse(request);

    std::cout << (exchange.transcript ? *exchange.transcript : std::string("(no transcript)")) << std::endl;
    std::cout << "reason: " << toString(exchange.reason) << ", duration: " << exchange.durationMs << "ms" << std::endl;
    if (!exchange.savedAudioPath.empty())
    {
      std::cout << "audio: " << exchange.savedAudioPath << std::endl;
    }
    return exchange.reason == TerminalReason::TranscriptionFailed ? 1 : 0;
  }
  catch (const DeviceError &e)
  {
    AppLogger::getInstance().error("Audio device error: " + std::string(e.what()));
    speak_error("Audio device is not available.");
    return 1;
  }
  catch (const std::exception &e)
  {
    AppLogger::getInstance().error("Unhandled exception: " + std::string(e.what()));
    speak_error("An unexpected critical error occurred.");
    return 1;
  }
}
