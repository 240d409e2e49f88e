#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Audio hardware missing, busy or failing. Fatal for the current call.
class DeviceError : public std::runtime_error
{
public:
  explicit DeviceError(const std::string &message) : std::runtime_error(message) {}
};

// A frame reached a classifier in a shape it cannot process.
class ClassifierInputError : public std::logic_error
{
public:
  explicit ClassifierInputError(const std::string &message) : std::logic_error(message) {}
};

// Transcoding between PCM and a compressed encoding failed.
class CodecError : public std::runtime_error
{
public:
  explicit CodecError(const std::string &message) : std::runtime_error(message) {}
};

// Base of every per-endpoint failure. Only FailoverExecutor catches these.
class EndpointError : public std::runtime_error
{
public:
  EndpointError(const std::string &endpoint, const std::string &message)
      : std::runtime_error(endpoint + ": " + message), endpoint_(endpoint), reason_(message) {}

  const std::string &endpoint() const { return endpoint_; }
  const std::string &reason() const { return reason_; }

private:
  std::string endpoint_;
  std::string reason_;
};

class EndpointUnreachable : public EndpointError
{
public:
  using EndpointError::EndpointError;
};

class EndpointTimeout : public EndpointError
{
public:
  using EndpointError::EndpointError;
};

class EndpointBadResponse : public EndpointError
{
public:
  using EndpointError::EndpointError;
};

enum class AttemptOutcome
{
  Ok,
  Unreachable,
  Timeout,
  BadResponse,
  Skipped
};

const char *toString(AttemptOutcome outcome);

struct EndpointAttempt
{
  std::string baseUrl;
  AttemptOutcome outcome = AttemptOutcome::Ok;
  std::string detail;
  long elapsedMs = 0;
};

// Every endpoint of one kind failed. what() lists each endpoint and reason.
class AllEndpointsFailed : public std::runtime_error
{
public:
  AllEndpointsFailed(const std::string &operation, std::vector<EndpointAttempt> attempts);

  const std::vector<EndpointAttempt> &attempts() const { return attempts_; }

private:
  std::vector<EndpointAttempt> attempts_;

  static std::string describe(const std::string &operation, const std::vector<EndpointAttempt> &attempts);
};
