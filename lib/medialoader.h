// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef MEDIALOADER_H
#define MEDIALOADER_H

#include "medialoadthread.h"

#include <QObject>

#include <memory>

// Runs at most one MediaLoadThread at a time.
//
// Each load ends with exactly one of loaded(), failed() or canceled(),
// emitted after every progressChanged() of that load. Progress reported
// after cancel() is dropped.
class MediaLoader : public QObject
{
  Q_OBJECT
public:
  explicit MediaLoader(QObject* parent = nullptr);
  ~MediaLoader();

  const ExternalTools& tools() const;
  void setTools(const ExternalTools& tools);

  int bucketCount() const;
  void setBucketCount(int n);

  bool load(const QString& filePath);
  bool isLoading() const;
  const QString& currentFilePath() const;

  void cancel();

  void waitForFinished();

Q_SIGNALS:
  void progressChanged(int percent, const QString& status);
  void loaded(const MediaLoadResult& result);
  void failed(const QString& filePath, const QString& message);
  void canceled(const QString& filePath);

private Q_SLOTS:
  void onThreadProgressChanged(int percent, const QString& status);
  void onThreadFinished();

private:
  ExternalTools m_tools;
  int m_bucketCount = 4000;
  QString m_filePath;
  std::unique_ptr<MediaLoadThread> m_thread;
  bool m_canceled = false;
};

#endif // MEDIALOADER_H
