// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

constexpr const char* FFMPEG_PATH_KEY = "tools/ffmpeg";
constexpr const char* FFMPEG_PATH_DEFAULT = "ffmpeg";

constexpr const char* FFPROBE_PATH_KEY = "tools/ffprobe";
constexpr const char* FFPROBE_PATH_DEFAULT = "ffprobe";

constexpr const char* EXPORT_COPY_POLICY_KEY = "export/copyPolicy";
constexpr const char* EXPORT_COPY_POLICY_DEFAULT = "auto";

constexpr const char* EXPORT_PARALLEL_JOBS_KEY = "export/parallelJobs";
constexpr int EXPORT_PARALLEL_JOBS_DEFAULT = 2;

constexpr const char* EXPORT_TIMEOUT_KEY = "export/timeoutMinutes";
constexpr int EXPORT_TIMEOUT_DEFAULT = 60;

constexpr const char* WAVEFORM_BUCKETS_KEY = "waveform/buckets";
constexpr int WAVEFORM_BUCKETS_DEFAULT = 4000;

constexpr const char* WINDOW_GEOMETRY_KEY = "Window/geometry";
constexpr const char* LAST_OPEN_DIR_KEY = "Window/lastOpenDir";
constexpr const char* LAST_SAVE_DIR_KEY = "Window/lastSaveDir";
