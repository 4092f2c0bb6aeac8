#include "exportplanner.h"

#include <algorithm>
#include <numeric>

ErrorCode computeKeepSegments(const std::vector<TimeSegment>& cuts,
                              int64_t duration,
                              std::vector<TimeSegment>& keepSegments)
{
  keepSegments.clear();

  std::vector<TimeSegment> sorted = cuts;
  std::sort(sorted.begin(), sorted.end(), [](const TimeSegment& a, const TimeSegment& b) {
    return a.start() < b.start();
  });

  std::vector<TimeSegment> result;
  result.reserve(sorted.size() + 1);

  int64_t curtime = 0;
  const TimeSegment* previous = nullptr;

  for (const TimeSegment& cut : sorted)
  {
    if (previous && previous->overlaps(cut))
    {
      return ErrorCode::OverlapError;
    }

    const int64_t keep_end = std::min(cut.start(), duration);
    if (keep_end > curtime)
    {
      result.push_back(TimeSegment(curtime, keep_end));
    }

    curtime = std::max(curtime, cut.end());
    previous = &cut;
  }

  if (curtime < duration)
  {
    result.push_back(TimeSegment(curtime, duration));
  }

  if (result.empty())
  {
    return ErrorCode::EmptyResultError;
  }

  keepSegments = std::move(result);
  return ErrorCode::NoError;
}

int64_t totalDuration(const std::vector<TimeSegment>& segments)
{
  return std::accumulate(segments.begin(),
                         segments.end(),
                         int64_t(0),
                         [](int64_t acc, const TimeSegment& s) { return acc + s.duration(); });
}
