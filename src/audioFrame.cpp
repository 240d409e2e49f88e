#include "audioFrame.hpp"

#include <algorithm>
#include <cmath>

std::vector<int16_t> resampleLinear(const int16_t *input, size_t count, int fromRate, int toRate)
{
  if (count == 0 || fromRate <= 0 || toRate <= 0)
  {
    return {};
  }
  if (fromRate == toRate)
  {
    return std::vector<int16_t>(input, input + count);
  }

  const size_t outCount = static_cast<size_t>(static_cast<unsigned long long>(count) * toRate / fromRate);
  std::vector<int16_t> output(outCount);
  const double step = static_cast<double>(fromRate) / static_cast<double>(toRate);

  for (size_t i = 0; i < outCount; ++i)
  {
    const double pos = static_cast<double>(i) * step;
    const size_t left = static_cast<size_t>(pos);
    const size_t right = std::min(left + 1, count - 1);
    const double frac = pos - static_cast<double>(left);
    const double value = input[std::min(left, count - 1)] * (1.0 - frac) + input[right] * frac;
    output[i] = static_cast<int16_t>(std::clamp(std::lround(value), -32768L, 32767L));
  }
  return output;
}
