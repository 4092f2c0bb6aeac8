// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include "exerun.h"
#include "mediainfo.h"
#include "wav.h"

#include <QThread>

struct MediaLoadResult
{
  MediaInfo media;
  WaveformPeaks peaks;
};

// Probes a video and computes its audio waveform.
// Interrupting the thread kills the running external process.
class MediaLoadThread : public QThread
{
  Q_OBJECT
public:
  MediaLoadThread(const QString& filePath, const ExternalTools& tools, int bucketCount);
  ~MediaLoadThread();

  const QString& filePath() const;

  bool succeeded() const;
  const QString& errorString() const;
  MediaLoadResult& result();

Q_SIGNALS:
  void progressChanged(int percent, const QString& status);

protected:
  void run() final;

private:
  WaveformPeaks computeWaveform();

private:
  QString m_filePath;
  ExternalTools m_tools;
  int m_bucketCount;
  bool m_succeeded = false;
  QString m_errorString;
  MediaLoadResult m_result;
};
