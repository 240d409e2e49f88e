#include "providerRegistry.hpp"
#include "AppLogger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

const char *toString(ProviderKind kind)
{
  return kind == ProviderKind::Tts ? "tts" : "stt";
}

const char *toString(EndpointStatus status)
{
  switch (status)
  {
  case EndpointStatus::Unknown:
    return "unknown";
  case EndpointStatus::Ok:
    return "ok";
  case EndpointStatus::Unreachable:
    return "unreachable";
  }
  return "unknown";
}

const char *toString(AudioEncoding encoding)
{
  switch (encoding)
  {
  case AudioEncoding::Pcm:
    return "pcm";
  case AudioEncoding::Wav:
    return "wav";
  case AudioEncoding::Mp3:
    return "mp3";
  case AudioEncoding::Opus:
    return "opus";
  case AudioEncoding::Aac:
    return "aac";
  case AudioEncoding::Flac:
    return "flac";
  }
  return "pcm";
}

std::optional<AudioEncoding> parseEncoding(const std::string &name)
{
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (AudioEncoding encoding : {AudioEncoding::Pcm, AudioEncoding::Wav, AudioEncoding::Mp3, AudioEncoding::Opus,
                                 AudioEncoding::Aac, AudioEncoding::Flac})
  {
    if (lower == toString(encoding))
    {
      return encoding;
    }
  }
  return std::nullopt;
}

bool isCompressed(AudioEncoding encoding)
{
  return encoding != AudioEncoding::Pcm && encoding != AudioEncoding::Wav;
}

std::string BaseUrl::origin() const
{
  return scheme + "://" + host + ":" + std::to_string(port);
}

BaseUrl parseBaseUrl(const std::string &url)
{
  BaseUrl parsed;
  const size_t schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos)
  {
    throw std::invalid_argument("URL has no scheme: " + url);
  }
  parsed.scheme = url.substr(0, schemeEnd);
  if (parsed.scheme != "http" && parsed.scheme != "https")
  {
    throw std::invalid_argument("unsupported URL scheme: " + url);
  }

  const size_t hostStart = schemeEnd + 3;
  const size_t pathStart = url.find('/', hostStart);
  std::string authority = url.substr(hostStart, pathStart == std::string::npos ? std::string::npos : pathStart - hostStart);
  parsed.path = pathStart == std::string::npos ? "" : url.substr(pathStart);
  while (!parsed.path.empty() && parsed.path.back() == '/')
  {
    parsed.path.pop_back();
  }

  parsed.port = parsed.scheme == "https" ? 443 : 80;
  if (!authority.empty() && authority.front() == '[')
  {
    const size_t close = authority.find(']');
    if (close == std::string::npos)
    {
      throw std::invalid_argument("malformed IPv6 host: " + url);
    }
    parsed.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':')
    {
      parsed.port = std::stoi(authority.substr(close + 2));
    }
  }
  else
  {
    const size_t colon = authority.rfind(':');
    parsed.host = authority.substr(0, colon);
    if (colon != std::string::npos)
    {
      try
      {
        parsed.port = std::stoi(authority.substr(colon + 1));
      }
      catch (const std::exception &)
      {
        throw std::invalid_argument("bad port in URL: " + url);
      }
    }
  }

  if (parsed.host.empty())
  {
    throw std::invalid_argument("URL has no host: " + url);
  }
  return parsed;
}

bool isLocalUrl(const std::string &url)
{
  BaseUrl parsed;
  try
  {
    parsed = parseBaseUrl(url);
  }
  catch (const std::invalid_argument &)
  {
    return false;
  }

  const std::string &host = parsed.host;
  if (host == "localhost" || host == "::1" || host == "0.0.0.0" || host.rfind("127.", 0) == 0)
  {
    return true;
  }
  if (host.rfind("10.", 0) == 0 || host.rfind("192.168.", 0) == 0)
  {
    return true;
  }
  if (host.rfind("172.", 0) == 0)
  {
    const int second = std::atoi(host.c_str() + 4);
    return second >= 16 && second <= 31;
  }
  return host.size() > 6 && host.compare(host.size() - 6, 6, ".local") == 0;
}

bool ProviderEndpoint::accepts(AudioEncoding encoding) const
{
  return std::find(encodings.begin(), encodings.end(), encoding) != encodings.end();
}

const ProviderEndpoint &ProviderRegistry::add(const EndpointSpec &spec)
{
  parseBaseUrl(spec.baseUrl);

  auto endpoint = std::make_unique<ProviderEndpoint>();
  endpoint->kind = spec.kind;
  endpoint->baseUrl = spec.baseUrl;
  while (!endpoint->baseUrl.empty() && endpoint->baseUrl.back() == '/')
  {
    endpoint->baseUrl.pop_back();
  }
  endpoint->priority = static_cast<int>(endpoints(spec.kind).size());
  endpoint->isLocal = spec.localOverride.value_or(isLocalUrl(spec.baseUrl));
  endpoint->model = spec.model;
  endpoint->voice = spec.voice;
  endpoint->language = spec.language;
  endpoint->encodings = spec.encodings;
  endpoint->apiKey = spec.apiKey;
  endpoint->extraHeaders = spec.extraHeaders;

  AppLogger::getInstance().info(std::string("Registered ") + toString(spec.kind) + " endpoint #" +
                                std::to_string(endpoint->priority) + " " + endpoint->baseUrl +
                                (endpoint->isLocal ? " (local)" : " (remote)"));

  endpoints_.push_back(std::move(endpoint));
  return *endpoints_.back();
}

std::vector<const ProviderEndpoint *> ProviderRegistry::endpoints(ProviderKind kind) const
{
  std::vector<const ProviderEndpoint *> result;
  for (const auto &endpoint : endpoints_)
  {
    if (endpoint->kind == kind)
    {
      result.push_back(endpoint.get());
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const ProviderEndpoint *a, const ProviderEndpoint *b) { return a->priority < b->priority; });
  return result;
}

void ProviderRegistry::recordStatus(const ProviderEndpoint &endpoint, EndpointStatus status) const
{
  EndpointStatus previous = endpoint.status.exchange(status);
  if (previous != status)
  {
    AppLogger::getInstance().debug(endpoint.baseUrl + " status " + toString(previous) + " -> " + toString(status));
  }
}
