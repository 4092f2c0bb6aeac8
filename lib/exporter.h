// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include "errors.h"
#include "exerun.h"
#include "mediainfo.h"
#include "timesegment.h"

#include <QObject>

#include <memory>
#include <optional>
#include <vector>

class QProcess;

enum class CopyPolicy {
  Auto,
  StreamCopy,
  Reencode,
};

QString toString(CopyPolicy policy);
CopyPolicy copyPolicyFromString(const QString& text, bool* ok = nullptr);

struct ExportOptions
{
  ExternalTools tools;
  CopyPolicy copyPolicy = CopyPolicy::Auto;
  int maxParallelJobs = 2;
  int timeout = 60 * 60 * 1000; // msecs, 0 disables the timeout
  QString temporaryDirectory;   // defaults to the system temp dir
};

struct ExportFailure
{
  ErrorCode code = ErrorCode::NoError;
  QString step;
  int segmentIndex = -1;
  TimeSegment segment;
  QString diagnostics;

  QString toString() const;
};

QStringList extractionArguments(const QString& inputPath,
                                double startTime,
                                double endTime,
                                const QString& outputPath,
                                bool copyMode);

QStringList concatenationArguments(const QString& listFilePath, const QString& outputPath);

// Returns the position (in seconds) of the keyframe the segment can be cut
// at without re-encoding, if any.
std::optional<double> findKeyframeStart(const TimeSegment& segment,
                                        const std::vector<double>& keyframes,
                                        double tolerance);

// Writes a video containing only the keep-segments of the media.
//
// Each segment is extracted to a temporary file, then the files are
// concatenated next to the destination and renamed over it. A failure at
// any step kills the running processes, removes every temporary file and
// leaves the destination untouched.
class TrimExporter : public QObject
{
  Q_OBJECT
  Q_PROPERTY(QString status READ status NOTIFY statusChanged)
  Q_PROPERTY(float progress READ progress NOTIFY progressChanged)
public:
  enum class State {
    Idle,
    ProbingKeyframes,
    Extracting,
    Concatenating,
    Done,
    Failed,
  };

  TrimExporter(const MediaInfo& media,
               const std::vector<TimeSegment>& keepSegments,
               QObject* parent = nullptr);
  ~TrimExporter();

  const MediaInfo& media() const;
  const std::vector<TimeSegment>& keepSegments() const;

  const QString& outputFilePath() const;
  void setOutputFilePath(const QString& path);

  const ExportOptions& options() const;
  void setOptions(const ExportOptions& options);

  bool run();
  bool isRunning() const;
  void cancel();

  State state() const;
  QString status() const;
  float progress() const;
  bool usesStreamCopy() const;
  const ExportFailure& failure() const;

  void waitForFinished();

Q_SIGNALS:
  void statusChanged();
  void progressChanged();
  void finished(bool success);

private Q_SLOTS:
  void step();
  void onTimeout();

private:
  void setState(State s);
  void decideCopyMode(const std::vector<double>& keyframes);
  void launchPendingExtractions();
  void onExtractionFinished(QProcess* process, int index);
  void concatenate();
  void onConcatenationFinished(QProcess* process);
  void succeed();
  void fail(ErrorCode code, const QString& step, int index, const QString& diagnostics);
  void terminateProcesses();
  QString segmentFilePath(int index) const;

  QString currentStepName() const;

  // the callback receives the process once it finished or failed to start
  template<typename Callback>
  QProcess* prepare(const QString& program, const QStringList& args, Callback&& onFinished);

private:
  MediaInfo m_media;
  std::vector<TimeSegment> m_keepSegments;
  QString m_outputFilePath;
  ExportOptions m_options;
  State m_state = State::Idle;
  bool m_streamCopy = false;
  ExportFailure m_failure;
  struct Data;
  std::unique_ptr<Data> d;
};

// Runs an export to completion. Returns true on success; otherwise fills
// failure if provided.
bool exportTrimmed(const MediaInfo& media,
                   const std::vector<TimeSegment>& keepSegments,
                   const QString& outputFilePath,
                   const ExportOptions& options,
                   ExportFailure* failure = nullptr);
