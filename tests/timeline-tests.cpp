#include "mediainfo.h"
#include "timelinemapper.h"
#include "timesegment.h"

#include "testing.h"

#include <cmath>

namespace {

bool fuzzy_equal(double a, double b)
{
  return std::abs(a - b) < 1e-9;
}

void test_pixel_mapping()
{
  require(fuzzy_equal(pixelToTime(250, 1000, 60), 15), "pixel to time");
  require(fuzzy_equal(timeToPixel(15, 1000, 60), 250), "time to pixel");
  require(fuzzy_equal(pixelToTime(-10, 1000, 60), 0), "negative pixel clamped");
  require(fuzzy_equal(pixelToTime(2000, 1000, 60), 60), "pixel past the end clamped");
  require(fuzzy_equal(timeToPixel(90, 1000, 60), 1000), "time past the end clamped");
  require(fuzzy_equal(pixelToTime(100, 0, 60), 0), "zero width");
  require(fuzzy_equal(timeToPixel(10, 1000, 0), 0), "zero duration");
}

void test_quantize_seconds()
{
  require(fuzzy_equal(quantizeToFrame(1.004, 30), 1.0), "snap to nearest frame at 30 fps");
  require(fuzzy_equal(quantizeToFrame(0.125, 4), 0.25), "half frame rounds up");
  require(fuzzy_equal(quantizeToFrame(0.124, 4), 0), "below half frame rounds down");
  require(fuzzy_equal(quantizeToFrame(1.5, 0), 1.5), "no frame rate");
}

void test_quantize_msecs()
{
  const std::pair<int, int> pal{25, 1};
  require(quantizeToFrame(int64_t(20), pal) == 40, "20ms at 25 fps");
  require(quantizeToFrame(int64_t(19), pal) == 0, "19ms at 25 fps");
  require(quantizeToFrame(int64_t(1000), pal) == 1000, "frame boundary kept");

  const std::pair<int, int> ntsc{30000, 1001};
  require(quantizeToFrame(int64_t(1000), ntsc) == 1001, "1s at 29.97 fps");

  for (int64_t pos : {0, 17, 333, 1001, 59999, 123456})
  {
    const int64_t once = quantizeToFrame(pos, ntsc);
    require(quantizeToFrame(once, ntsc) == once, "quantization is idempotent");
  }
}

void test_timeline_quantize()
{
  const Timeline timeline{10.0, {25, 1}};
  require(timeline.durationMSecs() == 10000, "duration in msecs");
  require(fuzzy_equal(timeline.frameDelta(), 0.04), "frame delta");
  require(timeline.quantize(-50) == 0, "clamped to zero");
  require(timeline.quantize(12000) == 10000, "clamped to duration");
  require(timeline.quantize(1019) == 1000, "snapped to frame");
}

void test_duration_strings()
{
  require(Duration::fromString("1:30.5").toMSecs() == 90500, "m:ss.f");
  require(Duration::fromString("1:02:03.004").toMSecs() == 3723004, "h:mm:ss.zzz");
  require(Duration::fromString("42").toMSecs() == 42000, "plain seconds");

  Duration d{0};
  require(!d.parse("abc"), "garbage rejected");
  require(!d.parse("1:2:3:4"), "too many fields rejected");

  require(Duration(90500).toString(Duration::HHMMSSzzz) == "1:30.500", "m:ss.zzz format");
  require(Duration(3723004).toString(Duration::HHMMSSzzz) == "1:02:03.004", "h:mm:ss.zzz format");
  require(Duration(2500).toString(Duration::Seconds) == "2.500", "seconds format");
}

void test_time_segment()
{
  bool ok = false;
  const TimeSegment seg = TimeSegment::fromString("0:10-0:12.5", &ok);
  require(ok, "segment parsed");
  require(seg == TimeSegment(10000, 12500), "segment bounds");
  require(seg.duration() == 2500, "segment duration");

  TimeSegment::fromString("12", &ok);
  require(!ok, "single value rejected");

  TimeSegment::fromString("-5-10", &ok);
  require(!ok, "missing start rejected");
  TimeSegment::fromString("5--10", &ok);
  require(!ok, "empty bound rejected");
  TimeSegment::fromString("5-", &ok);
  require(!ok, "missing end rejected");

  require(seg.contains(10000) && !seg.contains(12500), "half-open segment");
  require(seg.overlaps(TimeSegment(12000, 13000)), "overlap detected");
  require(!seg.overlaps(TimeSegment(12500, 13000)), "abutting segments do not overlap");
}

} // namespace

int main()
{
  test_pixel_mapping();
  test_quantize_seconds();
  test_quantize_msecs();
  test_timeline_quantize();
  test_duration_strings();
  test_time_segment();
  return 0;
}
