// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef MEDIAINFO_H
#define MEDIAINFO_H

#include "timelinemapper.h"
#include "timesegment.h"

#include <QString>

#include <algorithm>
#include <cmath>
#include <utility>

class Timeline
{
public:
  Timeline() = default;
  Timeline(double duration, std::pair<int, int> frameRate)
      : m_duration(duration)
      , m_frameRate(frameRate)
  {}

  double duration() const;
  int64_t durationMSecs() const;

  double frameRate() const;
  double frameDelta() const;
  const std::pair<int, int>& frameRateAsRational() const;

  int64_t quantize(int64_t pos) const;

private:
  double m_duration = 0; // seconds
  std::pair<int, int> m_frameRate = {25, 1};
};

inline double Timeline::duration() const
{
  return m_duration;
}

inline int64_t Timeline::durationMSecs() const
{
  return std::llround(m_duration * 1000);
}

inline double Timeline::frameRate() const
{
  return m_frameRate.first / double(m_frameRate.second);
}

inline double Timeline::frameDelta() const
{
  return m_frameRate.second / double(m_frameRate.first);
}

inline const std::pair<int, int>& Timeline::frameRateAsRational() const
{
  return m_frameRate;
}

inline int64_t Timeline::quantize(int64_t pos) const
{
  const int64_t d = durationMSecs();
  pos = std::clamp<int64_t>(pos, 0, d);
  return std::min(quantizeToFrame(pos, m_frameRate), d);
}

struct MediaInfo
{
  QString filePath;
  QString title;
  Timeline timeline;
  bool hasAudio = false;
};

#endif // MEDIAINFO_H
