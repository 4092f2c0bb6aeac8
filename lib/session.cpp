#include "session.h"

#include "exportplanner.h"

Session::Session(const MediaInfo& media, WaveformPeaks peaks, QObject* parent)
    : QObject(parent)
    , m_media(media)
    , m_peaks(std::move(peaks))
{
  m_markers = new MarkerStore(this);
}

Session::~Session() {}

ErrorCode Session::placeMarker(int64_t pos)
{
  return markers().placeMarker(timeline().quantize(pos));
}

ErrorCode Session::planExport(std::vector<TimeSegment>& keepSegments) const
{
  return computeKeepSegments(markers().regions(), timeline().durationMSecs(), keepSegments);
}
