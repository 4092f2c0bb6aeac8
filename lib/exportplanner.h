// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include "errors.h"
#include "timesegment.h"

#include <vector>

// Computes the segments of [0, duration] that remain once the cut regions
// are removed. Zero-length segments are not emitted.
// Fails with OverlapError if two cuts overlap and with EmptyResultError if
// nothing would be kept.
ErrorCode computeKeepSegments(const std::vector<TimeSegment>& cuts,
                              int64_t duration,
                              std::vector<TimeSegment>& keepSegments);

int64_t totalDuration(const std::vector<TimeSegment>& segments);
