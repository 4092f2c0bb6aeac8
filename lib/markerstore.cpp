#include "markerstore.h"

#include <QDebug>

#include <algorithm>

MarkerStore::MarkerStore(QObject* parent)
    : QObject(parent)
{}

MarkerStore::~MarkerStore() {}

ErrorCode MarkerStore::placeMarker(int64_t pos)
{
  if (!m_pending.has_value())
  {
    m_pending = pos;
    Q_EMIT pendingMarkerChanged();
    Q_EMIT changed();
    return ErrorCode::NoError;
  }

  const TimeSegment region{*m_pending, pos};

  const ErrorCode err = checkRegion(region);
  if (err != ErrorCode::NoError)
  {
    qDebug() << "rejected region" << region.toString() << errorName(err);
    return err;
  }

  m_pending.reset();
  insertRegion(region);

  Q_EMIT pendingMarkerChanged();
  Q_EMIT regionAdded(region);
  Q_EMIT changed();

  return ErrorCode::NoError;
}

bool MarkerStore::removeLastMarker()
{
  if (m_pending.has_value())
  {
    m_pending.reset();
    Q_EMIT pendingMarkerChanged();
    Q_EMIT changed();
    return true;
  }

  if (m_history.empty())
  {
    return false;
  }

  return removeRegion(m_history.back());
}

bool MarkerStore::removeRegionAt(int64_t pos)
{
  std::optional<TimeSegment> region = regionAt(pos);
  return region.has_value() && removeRegion(*region);
}

bool MarkerStore::removeRegion(const TimeSegment& region)
{
  auto it = std::find(m_regions.begin(), m_regions.end(), region);
  if (it == m_regions.end())
  {
    return false;
  }

  m_regions.erase(it);
  m_history.erase(std::find(m_history.begin(), m_history.end(), region));

  Q_EMIT regionRemoved(region);
  Q_EMIT changed();

  return true;
}

void MarkerStore::clear()
{
  if (empty())
  {
    return;
  }

  const bool had_pending = m_pending.has_value();
  m_pending.reset();

  std::vector<TimeSegment> removed = std::move(m_regions);
  m_regions.clear();
  m_history.clear();

  if (had_pending)
  {
    Q_EMIT pendingMarkerChanged();
  }

  for (const TimeSegment& r : removed)
  {
    Q_EMIT regionRemoved(r);
  }

  Q_EMIT changed();
}

std::optional<TimeSegment> MarkerStore::regionAt(int64_t pos) const
{
  auto it = std::upper_bound(m_regions.begin(),
                             m_regions.end(),
                             pos,
                             [](int64_t v, const TimeSegment& e) { return v < e.start(); });

  if (it == m_regions.begin())
  {
    return std::nullopt;
  }

  const TimeSegment& candidate = *std::prev(it);
  if (pos <= candidate.end())
  {
    return candidate;
  }

  return std::nullopt;
}

ErrorCode MarkerStore::checkRegion(const TimeSegment& region) const
{
  if (region.end() <= region.start())
  {
    return ErrorCode::InvalidRegion;
  }

  const bool overlap = std::any_of(m_regions.begin(),
                                   m_regions.end(),
                                   [&region](const TimeSegment& e) {
                                     return e.overlaps(region);
                                   });

  return overlap ? ErrorCode::OverlapError : ErrorCode::NoError;
}

void MarkerStore::insertRegion(const TimeSegment& region)
{
  auto it = std::upper_bound(m_regions.begin(),
                             m_regions.end(),
                             region,
                             [](const TimeSegment& a, const TimeSegment& b) {
                               return a.start() < b.start();
                             });

  m_regions.insert(it, region);
  m_history.push_back(region);
}
