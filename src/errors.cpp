#include "errors.hpp"

#include <utility>

const char *toString(AttemptOutcome outcome)
{
  switch (outcome)
  {
  case AttemptOutcome::Ok:
    return "ok";
  case AttemptOutcome::Unreachable:
    return "unreachable";
  case AttemptOutcome::Timeout:
    return "timeout";
  case AttemptOutcome::BadResponse:
    return "bad response";
  case AttemptOutcome::Skipped:
    return "skipped";
  }
  return "unknown";
}

AllEndpointsFailed::AllEndpointsFailed(const std::string &operation, std::vector<EndpointAttempt> attempts)
    : std::runtime_error(describe(operation, attempts)), attempts_(std::move(attempts))
{
}

std::string AllEndpointsFailed::describe(const std::string &operation, const std::vector<EndpointAttempt> &attempts)
{
  if (attempts.empty())
  {
    return operation + " failed: no endpoints configured";
  }

  std::string text = operation + " failed on all endpoints:";
  for (const auto &attempt : attempts)
  {
    text += "\n  " + attempt.baseUrl + " -> " + toString(attempt.outcome);
    if (!attempt.detail.empty())
    {
      text += " (" + attempt.detail + ")";
    }
  }
  return text;
}
