// Copyright (C) 2026 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QString>

#include <cstdint>
#include <vector>

// amplitude range of a bucket of samples, normalized to [-1, 1]
struct WavePeak
{
  float min = 0;
  float max = 0;
};

using WaveformPeaks = std::vector<WavePeak>;

// Reads a mono 16-bit PCM wav file and splits its samples into bucketCount
// buckets. Returns an empty vector if the file cannot be read or is not
// supported.
WaveformPeaks extractPeaks(const QString& filePath, int bucketCount);

WaveformPeaks computePeaks(const std::vector<int16_t>& samples, int bucketCount);

inline const WavePeak* peakForTime(const WaveformPeaks& peaks, double t, double duration)
{
  if (peaks.empty() || duration <= 0 || t < 0 || t >= duration)
  {
    return nullptr;
  }

  const size_t index = static_cast<size_t>(t / duration * peaks.size());
  return index < peaks.size() ? &peaks[index] : nullptr;
}
