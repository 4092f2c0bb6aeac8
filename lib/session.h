// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef SESSION_H
#define SESSION_H

#include "markerstore.h"
#include "mediainfo.h"
#include "wav.h"

#include <QObject>

// A loaded video together with the cuts placed on it.
// Replaced as a whole when another video is loaded.
class Session : public QObject
{
  Q_OBJECT
public:
  Session(const MediaInfo& media, WaveformPeaks peaks, QObject* parent = nullptr);
  ~Session();

  const MediaInfo& media() const;
  const QString& filePath() const;
  const Timeline& timeline() const;
  const WaveformPeaks& peaks() const;

  MarkerStore& markers() const;

  ErrorCode placeMarker(int64_t pos);

  ErrorCode planExport(std::vector<TimeSegment>& keepSegments) const;

private:
  MediaInfo m_media;
  WaveformPeaks m_peaks;
  MarkerStore* m_markers = nullptr;
};

inline const MediaInfo& Session::media() const
{
  return m_media;
}

inline const QString& Session::filePath() const
{
  return m_media.filePath;
}

inline const Timeline& Session::timeline() const
{
  return m_media.timeline;
}

inline const WaveformPeaks& Session::peaks() const
{
  return m_peaks;
}

inline MarkerStore& Session::markers() const
{
  return *m_markers;
}

#endif // SESSION_H
