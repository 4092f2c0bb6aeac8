// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <cstdint>
#include <utility>

// Pixel <-> time conversions for a timeline spanning [0, duration] over
// timelineWidthPx pixels. Times are in seconds; results are clamped to
// [0, duration] (resp. [0, timelineWidthPx]).

double pixelToTime(double x, double timelineWidthPx, double duration);
double timeToPixel(double t, double timelineWidthPx, double duration);

// Rounds t to the nearest multiple of 1/frameRate.
// Exact half-frame positions are rounded up.
double quantizeToFrame(double t, double frameRate);

// Same as above for a position in msecs and a rational frame rate (num/den).
// The result is the (truncated) msec position of the nearest frame, which is
// stable under re-quantization.
int64_t quantizeToFrame(int64_t pos, const std::pair<int, int>& frameRate);
