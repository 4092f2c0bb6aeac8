#include "medialoadthread.h"

#include "cache.h"
#include "errors.h"
#include "mediaprobe.h"

#include <QDataStream>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

constexpr quint32 PEAKS_CACHE_MAGIC = 0x534e5050; // "SNPP"
constexpr quint32 PEAKS_CACHE_VERSION = 1;

bool read_peaks_from_disk(WaveformPeaks& peaks, int bucketCount, const QString& cacheFilePath)
{
  QFile file{cacheFilePath};
  if (!file.open(QIODevice::ReadOnly))
  {
    qDebug() << "could not open " << cacheFilePath;
    return false;
  }

  QDataStream stream{&file};

  quint32 magic = 0, version = 0, n = 0;
  stream >> magic >> version >> n;

  if (magic != PEAKS_CACHE_MAGIC || version != PEAKS_CACHE_VERSION || n > quint32(bucketCount))
  {
    return false;
  }

  peaks.resize(n);
  for (WavePeak& p : peaks)
  {
    stream >> p.min >> p.max;
  }

  if (stream.status() != QDataStream::Ok || !file.atEnd())
  {
    qDebug() << "warning: bad cache file " << cacheFilePath;
    peaks.clear();
    return false;
  }

  return true;
}

void save_peaks_to_disk(const WaveformPeaks& peaks, const QString& cacheFilePath)
{
  QFile file{cacheFilePath};
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
  {
    qDebug() << "could not write " << cacheFilePath;
    return;
  }

  QDataStream stream{&file};
  stream << PEAKS_CACHE_MAGIC << PEAKS_CACHE_VERSION << quint32(peaks.size());
  for (const WavePeak& p : peaks)
  {
    stream << p.min << p.max;
  }
}

MediaLoadThread::MediaLoadThread(const QString& filePath,
                                 const ExternalTools& tools,
                                 int bucketCount)
    : m_filePath(filePath)
    , m_tools(tools)
    , m_bucketCount(bucketCount)
{
  CreateCacheDir();
}

MediaLoadThread::~MediaLoadThread() {}

const QString& MediaLoadThread::filePath() const
{
  return m_filePath;
}

bool MediaLoadThread::succeeded() const
{
  return m_succeeded;
}

const QString& MediaLoadThread::errorString() const
{
  return m_errorString;
}

MediaLoadResult& MediaLoadThread::result()
{
  Q_ASSERT(isFinished());
  return m_result;
}

void MediaLoadThread::run()
{
  m_succeeded = false;
  m_errorString.clear();

  try
  {
    Q_EMIT progressChanged(10, "Checking video file...");

    m_result.media = probeMedia(m_filePath, m_tools, [this]() {
      return isInterruptionRequested();
    });

    if (m_result.media.hasAudio && !isInterruptionRequested())
    {
      m_result.peaks = computeWaveform();
    }

    if (isInterruptionRequested())
    {
      m_errorString = "canceled";
      return;
    }

    Q_EMIT progressChanged(100, "Complete!");
    m_succeeded = true;
  } catch (const LoadError& ex)
  {
    qWarning() << "could not load" << m_filePath << ":" << ex.what();
    m_errorString = QString::fromStdString(ex.what());
  }
}

WaveformPeaks MediaLoadThread::computeWaveform()
{
  WaveformPeaks peaks;

  const QString cache_filepath = GetCacheFileName(QFileInfo(m_filePath),
                                                  QString::number(m_bucketCount) + ".peaks");

  if (QFileInfo::exists(cache_filepath))
  {
    if (read_peaks_from_disk(peaks, m_bucketCount, cache_filepath))
    {
      return peaks;
    }
    else
    {
      QFile::remove(cache_filepath);
    }
  }

  Q_EMIT progressChanged(30, "Extracting audio...");

  QTemporaryDir temp_dir;
  if (!temp_dir.isValid())
  {
    throw LoadError("could not create temporary directory");
  }

  const QString wav_path = temp_dir.filePath("audio.wav");

  QStringList args;
  args << "-y"
       << "-hide_banner"
       << "-nostats";
  args << "-i" << m_filePath;
  args << "-vn";
  args << "-acodec"
       << "pcm_s16le";
  args << "-ar"
       << "44100";
  args << "-ac"
       << "1";
  args << wav_path;

  QString errors;
  const int code = exec(m_tools.ffmpeg, args, nullptr, &errors, [this]() {
    return isInterruptionRequested();
  });

  if (isInterruptionRequested())
  {
    return peaks;
  }

  if (code != 0)
  {
    throw LoadError(
        QString("audio extraction failed: %1").arg(errors.trimmed().split('\n').last()).toStdString());
  }

  Q_EMIT progressChanged(60, "Computing waveform...");

  peaks = extractPeaks(wav_path, m_bucketCount);

  if (!peaks.empty())
  {
    save_peaks_to_disk(peaks, cache_filepath);
  }

  return peaks;
}
