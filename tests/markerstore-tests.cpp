#include "markerstore.h"
#include "session.h"

#include "testing.h"

#include <algorithm>
#include <random>

namespace {

void test_consecutive_markers_create_region()
{
  MarkerStore store;
  require(store.placeMarker(1000) == ErrorCode::NoError, "first marker accepted");
  require(store.hasPendingMarker(), "first marker is pending");
  require(store.regions().empty(), "no region before second marker");

  require(store.placeMarker(2500) == ErrorCode::NoError, "second marker accepted");
  require(!store.hasPendingMarker(), "second marker completes the region");
  require(store.regions().size() == 1, "one region");
  require(store.regions().front() == TimeSegment(1000, 2500), "region bounds");
}

void test_invalid_region_leaves_state_unchanged()
{
  MarkerStore store;
  require(store.placeMarker(0) == ErrorCode::NoError, "marker");
  require(store.placeMarker(100) == ErrorCode::NoError, "marker");
  require(store.placeMarker(500) == ErrorCode::NoError, "pending marker");

  require(store.placeMarker(400) == ErrorCode::InvalidRegion, "end before start rejected");
  require(store.placeMarker(500) == ErrorCode::InvalidRegion, "end equal to start rejected");

  require(store.hasPendingMarker() && *store.pendingMarker() == 500, "pending marker kept");
  require(store.regions().size() == 1, "regions unchanged");

  require(store.placeMarker(600) == ErrorCode::NoError, "later end accepted afterwards");
  require(store.regions().size() == 2, "second region added");
}

void test_overlap_rejected_abutting_accepted()
{
  MarkerStore store;
  store.placeMarker(1000);
  store.placeMarker(2000);

  store.placeMarker(500);
  require(store.placeMarker(1500) == ErrorCode::OverlapError, "overlapping region rejected");
  require(store.placeMarker(3000) == ErrorCode::OverlapError, "enclosing region rejected");
  require(store.regions().size() == 1, "regions unchanged after overlap");
  require(store.removeLastMarker(), "drop pending marker");

  store.placeMarker(2000);
  require(store.placeMarker(2400) == ErrorCode::NoError, "abutting region accepted");

  store.placeMarker(200);
  require(store.placeMarker(1000) == ErrorCode::NoError, "region ending at a start accepted");

  require(store.regions().size() == 3, "three regions");
  require(store.regions().at(0) == TimeSegment(200, 1000), "regions sorted (0)");
  require(store.regions().at(1) == TimeSegment(1000, 2000), "regions sorted (1)");
  require(store.regions().at(2) == TimeSegment(2000, 2400), "regions sorted (2)");
}

void test_remove_last_marker()
{
  MarkerStore store;
  require(!store.removeLastMarker(), "no-op on empty store");
  require(store.empty(), "still empty");

  store.placeMarker(5000);
  store.placeMarker(6000);
  store.placeMarker(1000);
  store.placeMarker(2000);
  store.placeMarker(8000);

  require(store.removeLastMarker(), "removes pending marker");
  require(!store.hasPendingMarker(), "pending marker gone");
  require(store.regions().size() == 2, "regions untouched");

  require(store.removeLastMarker(), "removes a region");
  require(store.regions().size() == 1, "one region left");
  require(store.regions().front() == TimeSegment(5000, 6000),
          "most recently added region removed, not the last in time");

  require(store.removeLastMarker(), "removes the remaining region");
  require(store.empty(), "store empty");
  require(!store.removeLastMarker(), "no-op once empty");
}

void test_remove_region_at()
{
  MarkerStore store;
  store.placeMarker(1000);
  store.placeMarker(2000);
  store.placeMarker(3000);
  store.placeMarker(4000);

  require(!store.removeRegionAt(500), "nothing before the first region");
  require(!store.removeRegionAt(2500), "nothing between regions");
  require(store.regionAt(1000).has_value(), "region found at its start");
  require(store.regionAt(2000).has_value(), "region found at its end");

  require(store.removeRegionAt(4000), "region removed at its end");
  require(store.regions().size() == 1, "one region left");
  require(store.removeRegionAt(1500), "region removed from inside");
  require(store.regions().empty(), "no region left");
}

void test_notifications()
{
  MarkerStore store;

  int changes = 0, added = 0, removed = 0, pending = 0;
  QObject::connect(&store, &MarkerStore::changed, [&changes]() { ++changes; });
  QObject::connect(&store, &MarkerStore::regionAdded, [&added](const TimeSegment&) { ++added; });
  QObject::connect(&store, &MarkerStore::regionRemoved, [&removed](const TimeSegment&) {
    ++removed;
  });
  QObject::connect(&store, &MarkerStore::pendingMarkerChanged, [&pending]() { ++pending; });

  store.placeMarker(10);
  store.placeMarker(20);
  require(added == 1 && pending == 2 && changes == 2, "notifications on placement");

  store.placeMarker(30);
  store.placeMarker(25);
  require(changes == 3, "rejected placement does not notify");

  store.clear();
  require(removed == 1 && pending == 4 && changes == 4, "notifications on clear");
  require(store.empty(), "cleared");
}

void test_random_disjoint_pairs()
{
  std::mt19937 rng{1234};

  for (int round(0); round < 50; ++round)
  {
    MarkerStore store;
    int64_t cursor = 0;
    std::vector<TimeSegment> expected;

    const int n = std::uniform_int_distribution<int>(1, 20)(rng);
    for (int i(0); i < n; ++i)
    {
      const int64_t a = cursor + std::uniform_int_distribution<int64_t>(0, 500)(rng);
      const int64_t b = a + std::uniform_int_distribution<int64_t>(1, 500)(rng);
      cursor = b;

      require(store.placeMarker(a) == ErrorCode::NoError, "random start accepted");
      require(store.placeMarker(b) == ErrorCode::NoError, "random end accepted");
      expected.push_back(TimeSegment(a, b));

      const auto found = std::count(store.regions().begin(), store.regions().end(), expected.back());
      require(found == 1, "exactly one region for each placed pair");
    }

    require(store.regions() == expected, "regions match placed pairs");
  }
}

void test_session_snaps_markers()
{
  MediaInfo media;
  media.filePath = "/tmp/video.mp4";
  media.timeline = Timeline(10.0, {25, 1});

  Session session{media, WaveformPeaks()};

  require(session.placeMarker(1019) == ErrorCode::NoError, "start placed");
  require(*session.markers().pendingMarker() == 1000, "start snapped to 25 fps frame");

  require(session.placeMarker(1021) == ErrorCode::NoError, "end placed");
  require(session.markers().regions().front() == TimeSegment(1000, 1040), "end snapped");

  session.markers().clear();
  session.placeMarker(-300);
  require(*session.markers().pendingMarker() == 0, "negative position clamped");
  require(session.placeMarker(99999) == ErrorCode::NoError, "end past duration accepted");
  require(session.markers().regions().front() == TimeSegment(0, 10000), "end clamped");
}

void test_session_plan_export()
{
  MediaInfo media;
  media.timeline = Timeline(100.0, {25, 1});

  Session session{media, WaveformPeaks()};
  session.placeMarker(20000);
  session.placeMarker(40000);

  std::vector<TimeSegment> keep;
  require(session.planExport(keep) == ErrorCode::NoError, "plan succeeds");
  require(keep.size() == 2, "two keep-segments");
  require(keep.at(0) == TimeSegment(0, 20000), "first keep-segment");
  require(keep.at(1) == TimeSegment(40000, 100000), "second keep-segment");

  session.markers().clear();
  session.placeMarker(0);
  session.placeMarker(100000);
  require(session.planExport(keep) == ErrorCode::EmptyResultError, "whole video cut");
}

} // namespace

int main()
{
  test_consecutive_markers_create_region();
  test_invalid_region_leaves_state_unchanged();
  test_overlap_rejected_abutting_accepted();
  test_remove_last_marker();
  test_remove_region_at();
  test_notifications();
  test_random_disjoint_pairs();
  test_session_snaps_markers();
  test_session_plan_export();
  return 0;
}
