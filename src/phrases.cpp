#include "phrases.hpp"
#include "configLoader.hpp"

#include <algorithm>
#include <cctype>

const std::vector<std::string> REPEAT_PHRASES = {
    "repeat",
    "repeat that",
    "say that again",
    "say again",
    "come again",
    "pardon",
    "sorry, what",
    "what did you say"};

bool endsWithPhrase(const std::string &transcript, const std::vector<std::string> &phrases)
{
  std::string text = trim(transcript);
  while (!text.empty() && std::ispunct(static_cast<unsigned char>(text.back())))
  {
    text.pop_back();
  }
  text = trim(text);
  if (text.empty())
  {
    return false;
  }
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const std::string &phrase : phrases)
  {
    if (phrase.size() > text.size())
    {
      continue;
    }
    const size_t start = text.size() - phrase.size();
    if (text.compare(start, phrase.size(), phrase) != 0)
    {
      continue;
    }
    if (start == 0 || !std::isalnum(static_cast<unsigned char>(text[start - 1])))
    {
      return true;
    }
  }
  return false;
}
