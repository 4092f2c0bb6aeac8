#include "exportplanner.h"

#include "testing.h"

#include <algorithm>
#include <random>

namespace {

void test_single_cut()
{
  std::vector<TimeSegment> keep;
  require(computeKeepSegments({TimeSegment(20, 40)}, 100, keep) == ErrorCode::NoError,
          "single cut planned");
  require(keep.size() == 2, "two keep-segments");
  require(keep.at(0) == TimeSegment(0, 20), "keep before cut");
  require(keep.at(1) == TimeSegment(40, 100), "keep after cut");
  require(totalDuration(keep) == 80, "total duration");
}

void test_cuts_at_both_ends()
{
  std::vector<TimeSegment> keep;
  require(computeKeepSegments({TimeSegment(90, 100), TimeSegment(0, 10)}, 100, keep)
              == ErrorCode::NoError,
          "unsorted cuts planned");
  require(keep.size() == 1 && keep.front() == TimeSegment(10, 90), "middle kept");
}

void test_no_cut()
{
  std::vector<TimeSegment> keep;
  require(computeKeepSegments({}, 100, keep) == ErrorCode::NoError, "no cut");
  require(keep.size() == 1 && keep.front() == TimeSegment(0, 100), "whole video kept");
}

void test_everything_cut()
{
  std::vector<TimeSegment> keep{TimeSegment(1, 2)};
  require(computeKeepSegments({TimeSegment(0, 100)}, 100, keep) == ErrorCode::EmptyResultError,
          "empty result");
  require(keep.empty(), "no segment on error");

  require(computeKeepSegments({TimeSegment(0, 50), TimeSegment(50, 100)}, 100, keep)
              == ErrorCode::EmptyResultError,
          "abutting cuts covering everything");
}

void test_overlap()
{
  std::vector<TimeSegment> keep;
  require(computeKeepSegments({TimeSegment(10, 30), TimeSegment(20, 40)}, 100, keep)
              == ErrorCode::OverlapError,
          "overlapping cuts rejected");
  require(keep.empty(), "no segment on overlap");
}

void test_random_cuts_cover_timeline()
{
  std::mt19937 rng{42};

  for (int round(0); round < 200; ++round)
  {
    const int64_t duration = std::uniform_int_distribution<int64_t>(1000, 100000)(rng);

    std::vector<TimeSegment> cuts;
    int64_t cursor = 0;
    while (cursor < duration)
    {
      const int64_t a = cursor + std::uniform_int_distribution<int64_t>(0, 5000)(rng);
      const int64_t b = a + std::uniform_int_distribution<int64_t>(1, 5000)(rng);
      if (b > duration)
        break;
      cuts.push_back(TimeSegment(a, b));
      cursor = b;
    }

    std::shuffle(cuts.begin(), cuts.end(), rng);

    std::vector<TimeSegment> keep;
    const ErrorCode err = computeKeepSegments(cuts, duration, keep);
    if (err == ErrorCode::EmptyResultError)
    {
      require(totalDuration(cuts) == duration, "empty result only when everything is cut");
      continue;
    }

    require(err == ErrorCode::NoError, "random plan succeeds");
    require(totalDuration(keep) + totalDuration(cuts) == duration,
            "keep and cut segments cover the timeline");

    for (size_t i(0); i < keep.size(); ++i)
    {
      require(!keep[i].isEmpty(), "keep-segments are not empty");
      if (i > 0)
        require(keep[i - 1].end() < keep[i].start(), "keep-segments sorted and separated");

      for (const TimeSegment& cut : cuts)
      {
        require(!keep[i].overlaps(cut), "keep-segment does not overlap a cut");
      }
    }
  }
}

} // namespace

int main()
{
  test_single_cut();
  test_cuts_at_both_ends();
  test_no_cut();
  test_everything_cut();
  test_overlap();
  test_random_cuts_cover_timeline();
  return 0;
}
