#include <gtest/gtest.h>

#include "phrases.hpp"

TEST(RepeatPhrases, MatchIgnoringCase)
{
  EXPECT_TRUE(shouldRepeat("repeat"));
  EXPECT_TRUE(shouldRepeat("Repeat"));
  EXPECT_TRUE(shouldRepeat("REPEAT"));
}

TEST(RepeatPhrases, MatchAtEndOfSentence)
{
  EXPECT_TRUE(shouldRepeat("Can you repeat"));
  EXPECT_TRUE(shouldRepeat("I didn't hear, please repeat."));
  EXPECT_TRUE(shouldRepeat("Sorry, what"));
  EXPECT_TRUE(shouldRepeat("I'm sorry, pardon"));
}

TEST(RepeatPhrases, TrailingPunctuationAndWhitespaceIgnored)
{
  EXPECT_TRUE(shouldRepeat("repeat."));
  EXPECT_TRUE(shouldRepeat("repeat!"));
  EXPECT_TRUE(shouldRepeat("repeat?"));
  EXPECT_TRUE(shouldRepeat("  say that again?!  "));
}

TEST(RepeatPhrases, NotInMiddleOfSentence)
{
  EXPECT_FALSE(shouldRepeat("I repeat that this is important"));
  EXPECT_FALSE(shouldRepeat("repeat after me"));
  EXPECT_FALSE(shouldRepeat(""));
  EXPECT_FALSE(shouldRepeat("..."));
}

TEST(RepeatPhrases, RequiresWordBoundary)
{
  EXPECT_FALSE(shouldRepeat("unrepeat"));
  EXPECT_FALSE(shouldRepeat("the password is prepardon"));
}

TEST(RepeatPhrases, EveryDefinedPhraseMatches)
{
  for (const std::string &phrase : REPEAT_PHRASES)
  {
    EXPECT_TRUE(shouldRepeat(phrase)) << phrase;
    EXPECT_TRUE(shouldRepeat("Hello, " + phrase)) << phrase;
  }
}

TEST(RepeatPhrases, CustomPhraseList)
{
  EXPECT_TRUE(endsWithPhrase("ok, wait a moment", {"wait a moment"}));
  EXPECT_FALSE(endsWithPhrase("ok, wait a moment", {"repeat"}));
}
