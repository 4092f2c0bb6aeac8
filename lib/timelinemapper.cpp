#include "timelinemapper.h"

#include <algorithm>
#include <cmath>

double pixelToTime(double x, double timelineWidthPx, double duration)
{
  if (timelineWidthPx <= 0 || duration <= 0)
  {
    return 0;
  }

  return std::clamp(x / timelineWidthPx * duration, 0.0, duration);
}

double timeToPixel(double t, double timelineWidthPx, double duration)
{
  if (timelineWidthPx <= 0 || duration <= 0)
  {
    return 0;
  }

  return std::clamp(t / duration * timelineWidthPx, 0.0, timelineWidthPx);
}

double quantizeToFrame(double t, double frameRate)
{
  if (frameRate <= 0)
  {
    return t;
  }

  return std::floor(t * frameRate + 0.5) / frameRate;
}

int64_t quantizeToFrame(int64_t pos, const std::pair<int, int>& frameRate)
{
  const auto [num, den] = frameRate;

  if (num <= 0 || den <= 0)
  {
    return pos;
  }

  // frame = round-half-up(pos * num / (1000 * den))
  const int64_t scaled = pos * num + int64_t(500) * den;
  const int64_t divisor = int64_t(1000) * den;
  int64_t frame = scaled / divisor;
  if (scaled < 0 && scaled % divisor != 0)
  {
    --frame;
  }

  return (frame * divisor) / num;
}
