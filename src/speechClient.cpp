#include "speechClient.hpp"
#include "AppLogger.hpp"
#include "errors.hpp"

#include "httplib.h"
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace
{

httplib::Headers headersFor(const ProviderEndpoint &endpoint)
{
  httplib::Headers headers;
  if (!endpoint.apiKey.empty())
  {
    headers.emplace("Authorization", "Bearer " + endpoint.apiKey);
  }
  for (const auto &header : endpoint.extraHeaders)
  {
    headers.emplace(header.first, header.second);
  }
  return headers;
}

// Transport errors become EndpointUnreachable or EndpointTimeout, non-2xx
// statuses become EndpointBadResponse.
void checkResult(const ProviderEndpoint &endpoint, const httplib::Result &res, const std::string &what)
{
  if (!res)
  {
    const httplib::Error error = res.error();
    const std::string message = what + " failed: " + httplib::to_string(error);
    if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read ||
        error == httplib::Error::Write)
    {
      throw EndpointTimeout(endpoint.baseUrl, message);
    }
    throw EndpointUnreachable(endpoint.baseUrl, message);
  }

  if (res->status < 200 || res->status >= 300)
  {
    std::string body = res->body.substr(0, 200);
    throw EndpointBadResponse(endpoint.baseUrl,
                              what + " returned status " + std::to_string(res->status) + ": " + body);
  }
}

}

HttpSpeechClient::HttpSpeechClient(HttpTimeouts timeouts) : timeouts_(timeouts)
{
}

std::unique_ptr<httplib::Client> HttpSpeechClient::connect(const ProviderEndpoint &endpoint,
                                                           std::string &pathPrefix) const
{
  BaseUrl url;
  try
  {
    url = parseBaseUrl(endpoint.baseUrl);
  }
  catch (const std::invalid_argument &e)
  {
    throw EndpointUnreachable(endpoint.baseUrl, e.what());
  }
  pathPrefix = url.path;

  auto cli = std::make_unique<httplib::Client>(url.origin());
  cli->set_connection_timeout(std::chrono::milliseconds(timeouts_.connectMs));
  cli->set_read_timeout(std::chrono::milliseconds(timeouts_.readMs));
  cli->set_write_timeout(std::chrono::milliseconds(timeouts_.readMs));
  return cli;
}

std::string speechRequestBody(const SpeechRequest &request)
{
  nlohmann::json payload = {
      {"model", request.model},
      {"input", request.text},
      {"voice", request.voice},
      {"response_format", toString(request.format)},
      {"speed", request.speed}};
  // Invalid UTF-8 in the prompt becomes U+FFFD rather than a json exception.
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<uint8_t> HttpSpeechClient::synthesize(const ProviderEndpoint &endpoint, const SpeechRequest &request)
{
  std::string prefix;
  auto cli = connect(endpoint, prefix);

  AppLogger::getInstance().debug("POST " + endpoint.baseUrl + "/audio/speech voice=" + request.voice +
                                 " format=" + toString(request.format));

  auto res = cli->Post((prefix + "/audio/speech").c_str(), headersFor(endpoint), speechRequestBody(request),
                       "application/json");
  checkResult(endpoint, res, "speech");

  if (res->body.empty())
  {
    throw EndpointBadResponse(endpoint.baseUrl, "speech returned an empty body");
  }

  AppLogger::getInstance().info("Synthesized " + std::to_string(res->body.size()) + " bytes from " +
                                endpoint.baseUrl);
  return std::vector<uint8_t>(res->body.begin(), res->body.end());
}

TranscriptionResult HttpSpeechClient::transcribe(const ProviderEndpoint &endpoint,
                                                 const TranscriptionRequest &request)
{
  std::string prefix;
  auto cli = connect(endpoint, prefix);

  std::string audio_content(request.audio.begin(), request.audio.end());

  std::vector<httplib::MultipartFormData> items = {
      {"file",
       audio_content,
       std::string("recording.") + fileExtensionFor(request.format),
       mimeTypeFor(request.format)},
      {"model", request.model, "", ""},
      {"response_format", "json", "", ""}};
  if (!request.language.empty())
  {
    items.push_back({"language", request.language, "", ""});
  }

  AppLogger::getInstance().debug("POST " + endpoint.baseUrl + "/audio/transcriptions " +
                                 std::to_string(request.audio.size()) + " bytes " + toString(request.format));

  auto res = cli->Post((prefix + "/audio/transcriptions").c_str(), headersFor(endpoint), items);
  checkResult(endpoint, res, "transcription");

  return parseTranscription(endpoint.baseUrl, res->body);
}

void HttpSpeechClient::probe(const ProviderEndpoint &endpoint)
{
  std::string prefix;
  auto cli = connect(endpoint, prefix);
  auto res = cli->Get((prefix + "/models").c_str(), headersFor(endpoint));
  checkResult(endpoint, res, "health check");
}

TranscriptionResult parseTranscription(const std::string &endpoint, const std::string &body)
{
  nlohmann::json json;
  try
  {
    json = nlohmann::json::parse(body);
  }
  catch (const nlohmann::json::parse_error &e)
  {
    throw EndpointBadResponse(endpoint, std::string("transcription is not JSON: ") + e.what());
  }

  if (!json.is_object() || !json.contains("text") || !json["text"].is_string())
  {
    throw EndpointBadResponse(endpoint, "transcription has no text field");
  }

  TranscriptionResult result;
  result.text = json["text"].get<std::string>();
  if (json.contains("language") && json["language"].is_string())
  {
    result.language = json["language"].get<std::string>();
  }
  if (json.contains("duration") && json["duration"].is_number())
  {
    result.durationSeconds = json["duration"].get<double>();
  }
  if (json.contains("words") && json["words"].is_array())
  {
    result.wordCount = json["words"].size();
  }
  return result;
}

const char *mimeTypeFor(AudioEncoding encoding)
{
  switch (encoding)
  {
  case AudioEncoding::Wav:
    return "audio/wav";
  case AudioEncoding::Mp3:
    return "audio/mpeg";
  case AudioEncoding::Opus:
    return "audio/ogg";
  case AudioEncoding::Aac:
    return "audio/aac";
  case AudioEncoding::Flac:
    return "audio/flac";
  case AudioEncoding::Pcm:
    break;
  }
  return "application/octet-stream";
}

const char *fileExtensionFor(AudioEncoding encoding)
{
  switch (encoding)
  {
  case AudioEncoding::Opus:
    return "ogg";
  case AudioEncoding::Pcm:
    return "raw";
  default:
    return toString(encoding);
  }
}
