// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef MEDIAPROBE_H
#define MEDIAPROBE_H

#include "exerun.h"
#include "mediainfo.h"

#include <QMap>

#include <functional>
#include <vector>

// Parser for the default (key=value) output format of ffprobe.
class FFprobeOutputExtractor
{
private:
  QString m_output;

public:
  explicit FFprobeOutputExtractor(const QString& output)
      : m_output(output)
  {}

  QString tryExtract(const QString& key) const;
  QString extract(const QString& key) const;

  // key/value pairs of each [name]...[/name] section, in order
  std::vector<QMap<QString, QString>> sections(const QString& name) const;
};

bool parseFrameRate(const QString& text, std::pair<int, int>& frameRate);

// Throws LoadError if the file cannot be probed or has no video stream.
MediaInfo probeMedia(const QString& filePath,
                     const ExternalTools& tools = ExternalTools(),
                     const std::function<bool()>& interrupted = {});

// Timestamps (in seconds) of the keyframes of the first video stream.
// Returns false if ffprobe failed.
bool probeKeyframes(const QString& filePath,
                    const ExternalTools& tools,
                    std::vector<double>& keyframes,
                    QString* diagnostics = nullptr);

QStringList keyframeProbeArguments(const QString& filePath);
std::vector<double> parseKeyframes(const QString& ffprobeCsvOutput);

#endif // MEDIAPROBE_H
