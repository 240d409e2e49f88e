#pragma once

#include <string>
#include <vector>

// Replies asking for the prompt to be spoken again.
extern const std::vector<std::string> REPEAT_PHRASES;

// True when the transcript ends with one of the phrases, ignoring case,
// surrounding whitespace and trailing punctuation. The phrase must start on
// a word boundary.
bool endsWithPhrase(const std::string &transcript, const std::vector<std::string> &phrases);

inline bool shouldRepeat(const std::string &transcript)
{
  return endsWithPhrase(transcript, REPEAT_PHRASES);
}
