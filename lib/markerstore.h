// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef MARKERSTORE_H
#define MARKERSTORE_H

#include "errors.h"
#include "timesegment.h"

#include <QObject>

#include <optional>
#include <vector>

// Holds the cut regions placed by the user.
//
// Markers come in start/end pairs: the first call to placeMarker() creates
// a pending start marker, the second one completes it into a cut region.
// Regions are kept sorted by start and never overlap (regions sharing a
// boundary are accepted).
// A failed placeMarker() leaves the store unchanged.
class MarkerStore : public QObject
{
  Q_OBJECT
public:
  explicit MarkerStore(QObject* parent = nullptr);
  ~MarkerStore();

  ErrorCode placeMarker(int64_t pos);
  bool removeLastMarker();
  bool removeRegionAt(int64_t pos);
  bool removeRegion(const TimeSegment& region);
  void clear();

  const std::vector<TimeSegment>& regions() const;
  std::optional<TimeSegment> regionAt(int64_t pos) const;
  bool empty() const;

  const std::optional<int64_t>& pendingMarker() const;
  bool hasPendingMarker() const;

Q_SIGNALS:
  void pendingMarkerChanged();
  void regionAdded(const TimeSegment& region);
  void regionRemoved(const TimeSegment& region);
  void changed();

private:
  ErrorCode checkRegion(const TimeSegment& region) const;
  void insertRegion(const TimeSegment& region);

private:
  std::optional<int64_t> m_pending;
  std::vector<TimeSegment> m_regions; // sorted by start
  std::vector<TimeSegment> m_history; // insertion order
};

inline const std::vector<TimeSegment>& MarkerStore::regions() const
{
  return m_regions;
}

inline bool MarkerStore::empty() const
{
  return m_regions.empty() && !m_pending.has_value();
}

inline const std::optional<int64_t>& MarkerStore::pendingMarker() const
{
  return m_pending;
}

inline bool MarkerStore::hasPendingMarker() const
{
  return m_pending.has_value();
}

#endif // MARKERSTORE_H
