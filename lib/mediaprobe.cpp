#include "mediaprobe.h"

#include "errors.h"

#include <QFileInfo>

#include <algorithm>

QString FFprobeOutputExtractor::tryExtract(const QString& key) const
{
  const QString prefix = key + "=";
  int i = m_output.indexOf(prefix);

  // the key must start a line
  while (i > 0 && m_output.at(i - 1) != '\n')
  {
    i = m_output.indexOf(prefix, i + 1);
  }

  if (i == -1)
  {
    return QString();
  }

  i += prefix.length();
  int j = m_output.indexOf('\n', i);
  if (j == -1)
  {
    j = m_output.length();
  }

  return m_output.mid(i, j - i).simplified();
}

QString FFprobeOutputExtractor::extract(const QString& key) const
{
  QString val = tryExtract(key);

  if (val.isNull())
  {
    throw LoadError("no such value: " + key.toStdString());
  }

  return val;
}

std::vector<QMap<QString, QString>> FFprobeOutputExtractor::sections(const QString& name) const
{
  std::vector<QMap<QString, QString>> result;

  const QString begin = "[" + name + "]";
  const QString end = "[/" + name + "]";

  QMap<QString, QString>* current = nullptr;

  for (const QString& rawline : m_output.split('\n'))
  {
    const QString line = rawline.trimmed();

    if (line == begin)
    {
      result.emplace_back();
      current = &result.back();
    }
    else if (line == end)
    {
      current = nullptr;
    }
    else if (current)
    {
      const int eq = line.indexOf('=');
      if (eq > 0)
      {
        current->insert(line.left(eq), line.mid(eq + 1));
      }
    }
  }

  return result;
}

bool parseFrameRate(const QString& text, std::pair<int, int>& frameRate)
{
  const QStringList parts = text.split('/');
  if (parts.size() != 2)
  {
    return false;
  }

  bool ok1 = false, ok2 = false;
  const int num = parts.at(0).toInt(&ok1);
  const int den = parts.at(1).toInt(&ok2);

  if (!ok1 || !ok2 || num <= 0 || den <= 0)
  {
    return false;
  }

  frameRate = {num, den};
  return true;
}

MediaInfo probeMedia(const QString& filePath,
                     const ExternalTools& tools,
                     const std::function<bool()>& interrupted)
{
  if (!QFileInfo(filePath).isFile())
  {
    throw LoadError("no such file: " + filePath.toStdString());
  }

  QString output;
  QString errors;
  auto args = QStringList() << "-v"
                            << "error"
                            << "-show_entries"
                            << "stream=codec_type,r_frame_rate"
                            << "-show_entries"
                            << "format=duration"
                            << "-show_entries"
                            << "format_tags=title" << filePath;

  const int code = exec(tools.ffprobe, args, &output, &errors, interrupted);

  if (code != 0)
  {
    throw LoadError(QString("%1 failed: %2").arg(tools.ffprobe, errors.trimmed()).toStdString());
  }

  FFprobeOutputExtractor extractor{output};

  MediaInfo info;
  info.filePath = filePath;
  info.title = extractor.tryExtract("TAG:title");

  std::pair<int, int> frame_rate;
  bool has_video = false;

  for (const QMap<QString, QString>& stream : extractor.sections("STREAM"))
  {
    const QString type = stream.value("codec_type");

    if (type == "audio")
    {
      info.hasAudio = true;
    }
    else if (type == "video" && !has_video)
    {
      if (!parseFrameRate(stream.value("r_frame_rate"), frame_rate))
      {
        throw LoadError("bad r_frame_rate value");
      }

      has_video = true;
    }
  }

  if (!has_video)
  {
    throw LoadError("no video stream in " + filePath.toStdString());
  }

  bool ok = false;
  const double duration = extractor.extract("duration").toDouble(&ok);
  if (!ok || duration <= 0)
  {
    throw LoadError("bad duration value");
  }

  info.timeline = Timeline(duration, frame_rate);

  return info;
}

bool probeKeyframes(const QString& filePath,
                    const ExternalTools& tools,
                    std::vector<double>& keyframes,
                    QString* diagnostics)
{
  QString output;

  if (exec(tools.ffprobe, keyframeProbeArguments(filePath), &output, diagnostics) != 0)
  {
    return false;
  }

  keyframes = parseKeyframes(output);
  return true;
}

QStringList keyframeProbeArguments(const QString& filePath)
{
  return QStringList() << "-v"
                       << "error"
                       << "-select_streams"
                       << "v:0"
                       << "-show_entries"
                       << "packet=pts_time,flags"
                       << "-of"
                       << "csv=p=0" << filePath;
}

std::vector<double> parseKeyframes(const QString& ffprobeCsvOutput)
{
  std::vector<double> result;

  for (const QString& line : ffprobeCsvOutput.split('\n', Qt::SkipEmptyParts))
  {
    const QStringList parts = line.trimmed().split(',');
    if (parts.size() < 2 || !parts.at(1).contains('K'))
    {
      continue;
    }

    bool ok = false;
    const double pts = parts.at(0).toDouble(&ok);
    if (ok)
    {
      result.push_back(pts);
    }
  }

  std::sort(result.begin(), result.end());
  return result;
}
