#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ProviderKind
{
  Tts,
  Stt
};

enum class EndpointStatus
{
  Unknown,
  Ok,
  Unreachable
};

enum class AudioEncoding
{
  Pcm,
  Wav,
  Mp3,
  Opus,
  Aac,
  Flac
};

const char *toString(ProviderKind kind);
const char *toString(EndpointStatus status);
const char *toString(AudioEncoding encoding);
std::optional<AudioEncoding> parseEncoding(const std::string &name);
bool isCompressed(AudioEncoding encoding);

struct BaseUrl
{
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path; // without trailing slash, e.g. "/v1"

  // "http://host:port", as httplib::Client expects it.
  std::string origin() const;
};

// Throws std::invalid_argument for anything that is not http(s)://host[:port][/path].
BaseUrl parseBaseUrl(const std::string &url);

// Loopback, RFC 1918 and *.local hosts.
bool isLocalUrl(const std::string &url);

struct EndpointSpec
{
  ProviderKind kind = ProviderKind::Tts;
  std::string baseUrl;
  std::string model;
  std::string voice;
  std::string language;
  std::vector<AudioEncoding> encodings;
  std::string apiKey;
  std::map<std::string, std::string> extraHeaders;
  std::optional<bool> localOverride;
};

// One reachable backend. Everything but status is fixed after registration.
struct ProviderEndpoint
{
  ProviderKind kind = ProviderKind::Tts;
  std::string baseUrl;
  int priority = 0;
  bool isLocal = false;
  std::string model;
  std::string voice;
  std::string language;
  std::vector<AudioEncoding> encodings;
  std::string apiKey;
  std::map<std::string, std::string> extraHeaders;

  mutable std::atomic<EndpointStatus> status{EndpointStatus::Unknown};

  bool accepts(AudioEncoding encoding) const;
};

// Ordered STT and TTS endpoints. Ordering is read-only after setup; only the
// atomic status fields change while conversations run.
class ProviderRegistry
{
public:
  const ProviderEndpoint &add(const EndpointSpec &spec);

  std::vector<const ProviderEndpoint *> endpoints(ProviderKind kind) const;

  void recordStatus(const ProviderEndpoint &endpoint, EndpointStatus status) const;

  size_t size() const { return endpoints_.size(); }

private:
  std::vector<std::unique_ptr<ProviderEndpoint>> endpoints_;
};
