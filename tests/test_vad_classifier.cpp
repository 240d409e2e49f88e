#include <gtest/gtest.h>

#include "errors.hpp"
#include "vadClassifier.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace
{

// Records the shape of every chunk and answers from a fixed pattern.
class RecordingClassifier : public VoiceActivityClassifier
{
public:
  explicit RecordingClassifier(std::vector<bool> answers) : answers_(std::move(answers)) {}

  bool isSpeech(const AudioFrame &frame) override
  {
    shapes.push_back({frame.sampleRate, frame.size()});
    bool answer = answers_.empty() ? false : answers_[next_ % answers_.size()];
    ++next_;
    return answer;
  }

  std::vector<std::pair<int, size_t>> shapes;

private:
  std::vector<bool> answers_;
  size_t next_ = 0;
};

}

TEST(ResamplingClassifier, ResamplesDeviceFramesToClassifierRate)
{
  auto inner = std::make_unique<RecordingClassifier>(std::vector<bool>{true});
  RecordingClassifier *recorder = inner.get();
  ResamplingClassifier classifier(std::move(inner), 16000);

  EXPECT_TRUE(classifier.isSpeech(AudioFrame(std::vector<int16_t>(720, 0), 24000)));
  ASSERT_EQ(recorder->shapes.size(), 1u);
  EXPECT_EQ(recorder->shapes[0].first, 16000);
  EXPECT_EQ(recorder->shapes[0].second, 480u);
}

TEST(ResamplingClassifier, SplitsLongFramesIntoLegalChunks)
{
  auto inner = std::make_unique<RecordingClassifier>(std::vector<bool>{false});
  RecordingClassifier *recorder = inner.get();
  ResamplingClassifier classifier(std::move(inner), 16000);

  classifier.isSpeech(AudioFrame(std::vector<int16_t>(2400, 0), 48000)); // 50 ms
  ASSERT_EQ(recorder->shapes.size(), 5u);
  for (const auto &shape : recorder->shapes)
  {
    EXPECT_EQ(shape.second, 160u);
  }
}

TEST(ResamplingClassifier, MajorityOfChunksDecides)
{
  auto inner = std::make_unique<RecordingClassifier>(std::vector<bool>{true, false, false});
  ResamplingClassifier classifier(std::move(inner), 16000);

  // 90 ms = three 30 ms chunks, one of them speech.
  EXPECT_FALSE(classifier.isSpeech(AudioFrame(std::vector<int16_t>(1440, 0), 16000)));
}

TEST(ResamplingClassifier, CarriesPartialChunksToTheNextFrame)
{
  auto inner = std::make_unique<RecordingClassifier>(std::vector<bool>{true});
  RecordingClassifier *recorder = inner.get();
  ResamplingClassifier classifier(std::move(inner), 16000);

  // 25 ms: two 10 ms chunks and 5 ms left over.
  EXPECT_TRUE(classifier.isSpeech(AudioFrame(std::vector<int16_t>(400, 0), 16000)));
  EXPECT_EQ(recorder->shapes.size(), 2u);
  EXPECT_EQ(classifier.pendingSamples(), 80u);

  classifier.isSpeech(AudioFrame(std::vector<int16_t>(400, 0), 16000));
  EXPECT_EQ(recorder->shapes.size(), 5u);
  EXPECT_EQ(classifier.pendingSamples(), 0u);

  // Too short for any chunk: buffered, previous judgment repeated.
  EXPECT_TRUE(classifier.isSpeech(AudioFrame(std::vector<int16_t>(7, 0), 16000)));
  EXPECT_EQ(recorder->shapes.size(), 5u);
  EXPECT_EQ(classifier.pendingSamples(), 7u);
}

TEST(ResamplingClassifier, AcceptsFramesThatAreNotWholeMilliseconds)
{
  auto inner = std::make_unique<RecordingClassifier>(std::vector<bool>{true});
  RecordingClassifier *recorder = inner.get();
  ResamplingClassifier classifier(std::move(inner), 16000);

  // 30 ms at 22050 Hz is 661 samples, which resample to 479 at 16 kHz.
  bool speech = false;
  for (int i = 0; i < 10; ++i)
  {
    ASSERT_NO_THROW(speech = classifier.isSpeech(AudioFrame(std::vector<int16_t>(661, 0), 22050)));
  }
  EXPECT_TRUE(speech);
  ASSERT_EQ(recorder->shapes.size(), 9u);
  for (const auto &shape : recorder->shapes)
  {
    EXPECT_EQ(shape.first, 16000);
    EXPECT_EQ(shape.second, 480u);
  }
  EXPECT_EQ(classifier.pendingSamples(), 10u * 479u - 9u * 480u);
}

TEST(ResamplingClassifier, RejectsEmptyFrames)
{
  ResamplingClassifier classifier(std::make_unique<RecordingClassifier>(std::vector<bool>{}), 16000);
  EXPECT_THROW(classifier.isSpeech(AudioFrame(std::vector<int16_t>(), 16000)), ClassifierInputError);
  EXPECT_THROW(classifier.isSpeech(AudioFrame(std::vector<int16_t>(480, 0), 0)), ClassifierInputError);
}

TEST(FvadClassifier, RejectsMismatchedFrames)
{
  FvadClassifier vad(3, 16000);
  EXPECT_THROW(vad.isSpeech(AudioFrame(std::vector<int16_t>(720, 0), 24000)), ClassifierInputError);
  EXPECT_THROW(vad.isSpeech(AudioFrame(std::vector<int16_t>(500, 0), 16000)), ClassifierInputError);
}

TEST(FvadClassifier, SilenceIsNotSpeech)
{
  FvadClassifier vad(3, 16000);
  EXPECT_FALSE(vad.isSpeech(AudioFrame(std::vector<int16_t>(480, 0), 16000)));
}

TEST(FvadClassifier, ValidatesConstructorArguments)
{
  EXPECT_THROW(FvadClassifier(4, 16000), std::invalid_argument);
  EXPECT_THROW(FvadClassifier(2, 24000), std::invalid_argument);
  EXPECT_TRUE(FvadClassifier::supportsShape(8000, 80));
  EXPECT_FALSE(FvadClassifier::supportsShape(8000, 100));
}

TEST(FvadClassifier, FactoryAcceptsDeviceRateFrames)
{
  std::unique_ptr<VoiceActivityClassifier> vad = makeVoiceClassifier(3);
  EXPECT_FALSE(vad->isSpeech(AudioFrame(std::vector<int16_t>(720, 0), 24000)));
  for (int i = 0; i < 3; ++i)
  {
    EXPECT_FALSE(vad->isSpeech(AudioFrame(std::vector<int16_t>(661, 0), 22050)));
  }
}
