#include "exporter.h"

#include "mediaprobe.h"

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>
#include <QTimer>

#include <algorithm>
#include <cmath>
#include <map>

QString toString(CopyPolicy policy)
{
  switch (policy)
  {
  case CopyPolicy::StreamCopy:
    return "copy";
  case CopyPolicy::Reencode:
    return "reencode";
  case CopyPolicy::Auto:
  default:
    return "auto";
  }
}

CopyPolicy copyPolicyFromString(const QString& text, bool* ok)
{
  const QString value = text.trimmed().toLower();

  if (ok)
  {
    *ok = true;
  }

  if (value == "copy")
  {
    return CopyPolicy::StreamCopy;
  }
  else if (value == "reencode")
  {
    return CopyPolicy::Reencode;
  }
  else if (value != "auto" && ok)
  {
    *ok = false;
  }

  return CopyPolicy::Auto;
}

QString ExportFailure::toString() const
{
  if (code == ErrorCode::NoError)
  {
    return QString();
  }

  QString text = errorName(code);

  if (!step.isEmpty())
  {
    text += " during " + step;
  }

  if (segmentIndex >= 0)
  {
    text += QString(" of segment %1 (%2)").arg(segmentIndex + 1).arg(segment.toString());
  }

  if (!diagnostics.isEmpty())
  {
    text += ": " + diagnostics;
  }

  return text;
}

QStringList extractionArguments(const QString& inputPath,
                                double startTime,
                                double endTime,
                                const QString& outputPath,
                                bool copyMode)
{
  QStringList args;
  args << "-y"
       << "-hide_banner"
       << "-nostats";
  args << "-ss" << QString::number(startTime, 'f', 6);
  args << "-i" << inputPath;
  args << "-t" << QString::number(std::max(0.0, endTime - startTime), 'f', 6);
  args << "-map"
       << "0:v:0";
  args << "-map"
       << "0:a?";

  if (copyMode)
  {
    args << "-c"
         << "copy";
    args << "-avoid_negative_ts"
         << "make_zero";
  }
  else
  {
    args << "-c:v"
         << "libx264";
    args << "-preset"
         << "fast";
    args << "-crf"
         << "18";
    args << "-c:a"
         << "aac";
  }

  args << outputPath;
  return args;
}

QStringList concatenationArguments(const QString& listFilePath, const QString& outputPath)
{
  QStringList args;
  args << "-y"
       << "-hide_banner"
       << "-nostats";
  args << "-f"
       << "concat"
       << "-safe"
       << "0";
  args << "-i" << listFilePath;
  args << "-map"
       << "0";
  args << "-c"
       << "copy";
  args << outputPath;
  return args;
}

std::optional<double> findKeyframeStart(const TimeSegment& segment,
                                        const std::vector<double>& keyframes,
                                        double tolerance)
{
  if (segment.start() == 0)
  {
    return 0.0;
  }

  const double t = segment.start() / double(1000);
  auto it = std::lower_bound(keyframes.begin(), keyframes.end(), t - tolerance);

  if (it != keyframes.end() && std::abs(*it - t) <= tolerance)
  {
    return *it;
  }

  return std::nullopt;
}

namespace {

bool process_succeeded(const QProcess* process)
{
  return process->error() != QProcess::FailedToStart
         && process->exitStatus() == QProcess::NormalExit && process->exitCode() == 0;
}

QString process_diagnostics(QProcess* process)
{
  if (process->error() == QProcess::FailedToStart)
  {
    return QString("could not start %1: %2").arg(process->program(), process->errorString());
  }

  QStringList lines = QString::fromLocal8Bit(process->readAllStandardError())
                          .split('\n', Qt::SkipEmptyParts);

  // ffmpeg reports the actual error last
  constexpr int max_lines = 20;
  if (lines.size() > max_lines)
  {
    lines = lines.mid(lines.size() - max_lines);
  }

  const QString header = process->exitStatus() == QProcess::CrashExit
                             ? QString("%1 crashed").arg(process->program())
                             : QString("%1 exited with code %2")
                                   .arg(process->program())
                                   .arg(process->exitCode());

  lines.prepend(header);
  return lines.join('\n');
}

} // namespace

struct TrimExporter::Data
{
  std::unique_ptr<QTemporaryDir> tempDir;
  QString extension;
  QString partialFilePath;

  std::vector<double> startTimes; // seconds

  QProcess* probe = nullptr;

  std::map<QProcess*, int> extractions;
  int nextSegment = 0;
  int numberOfSegmentsExtracted = 0;

  QProcess* concat = nullptr;

  QTimer timer;
};

TrimExporter::TrimExporter(const MediaInfo& media,
                           const std::vector<TimeSegment>& keepSegments,
                           QObject* parent)
    : QObject(parent)
    , m_media(media)
    , m_keepSegments(keepSegments)
{}

TrimExporter::~TrimExporter()
{
  if (d)
  {
    terminateProcesses();
    QFile::remove(d->partialFilePath);
  }
}

const MediaInfo& TrimExporter::media() const
{
  return m_media;
}

const std::vector<TimeSegment>& TrimExporter::keepSegments() const
{
  return m_keepSegments;
}

const QString& TrimExporter::outputFilePath() const
{
  return m_outputFilePath;
}

void TrimExporter::setOutputFilePath(const QString& path)
{
  m_outputFilePath = path;
}

const ExportOptions& TrimExporter::options() const
{
  return m_options;
}

void TrimExporter::setOptions(const ExportOptions& options)
{
  m_options = options;
}

bool TrimExporter::run()
{
  if (isRunning())
  {
    qDebug() << "export already running";
    return false;
  }

  m_failure = ExportFailure();
  m_state = State::Idle;
  m_streamCopy = false;

  qDebug() << "Exporting" << m_keepSegments.size() << "segments to" << m_outputFilePath;

  if (m_keepSegments.empty())
  {
    fail(ErrorCode::EmptyResultError, "export", -1, "nothing to export");
    return false;
  }

  if (m_outputFilePath.isEmpty())
  {
    fail(ErrorCode::ExternalToolError, "export", -1, "no output file");
    return false;
  }

  d = std::make_unique<Data>();

  const QString tempbase = m_options.temporaryDirectory.isEmpty() ? QDir::tempPath()
                                                                  : m_options.temporaryDirectory;
  d->tempDir = std::make_unique<QTemporaryDir>(QDir(tempbase).filePath("snipper-XXXXXX"));
  if (!d->tempDir->isValid())
  {
    fail(ErrorCode::ExternalToolError,
         "export",
         -1,
         "could not create temporary directory: " + d->tempDir->errorString());
    return false;
  }

  const QFileInfo output_info{m_outputFilePath};
  d->extension = output_info.suffix().isEmpty() ? QString("mkv") : output_info.suffix();
  d->partialFilePath = output_info.dir().filePath(
      QString(".%1.partial.%2").arg(output_info.completeBaseName(), d->extension));

  for (const TimeSegment& seg : m_keepSegments)
  {
    d->startTimes.push_back(seg.start() / double(1000));
  }

  if (m_options.timeout > 0)
  {
    d->timer.setSingleShot(true);
    connect(&d->timer, &QTimer::timeout, this, &TrimExporter::onTimeout);
    d->timer.start(m_options.timeout);
  }

  switch (m_options.copyPolicy)
  {
  case CopyPolicy::Auto:
    setState(State::ProbingKeyframes);
    break;
  case CopyPolicy::StreamCopy:
    m_streamCopy = true;
    setState(State::Extracting);
    break;
  case CopyPolicy::Reencode:
    m_streamCopy = false;
    setState(State::Extracting);
    break;
  }

  step();

  return m_state != State::Failed;
}

bool TrimExporter::isRunning() const
{
  return d != nullptr;
}

void TrimExporter::cancel()
{
  if (!isRunning())
  {
    return;
  }

  fail(ErrorCode::Canceled, currentStepName(), -1, "canceled by user");
}

TrimExporter::State TrimExporter::state() const
{
  return m_state;
}

QString TrimExporter::status() const
{
  switch (m_state)
  {
  case State::ProbingKeyframes:
    return "Probing keyframes";
  case State::Extracting: {
    const int n = int(m_keepSegments.size());
    const int i = d ? std::min(d->numberOfSegmentsExtracted + 1, n) : n;
    return QString("Extracting segment %1/%2").arg(i).arg(n);
  }
  case State::Concatenating:
    return "Concatenating segments";
  case State::Done:
    return "Done";
  case State::Failed:
    return "Failed: " + m_failure.toString();
  case State::Idle:
  default:
    break;
  }

  return QString();
}

float TrimExporter::progress() const
{
  switch (m_state)
  {
  case State::ProbingKeyframes:
    return 0.02f;
  case State::Extracting: {
    const float extracted = d ? d->numberOfSegmentsExtracted : 0;
    return 0.05f + 0.85f * extracted / m_keepSegments.size();
  }
  case State::Concatenating:
    return 0.9f;
  case State::Done:
    return 1;
  default:
    break;
  }

  return 0;
}

bool TrimExporter::usesStreamCopy() const
{
  return m_streamCopy;
}

const ExportFailure& TrimExporter::failure() const
{
  return m_failure;
}

void TrimExporter::waitForFinished()
{
  if (!isRunning())
  {
    return;
  }

  QEventLoop loop;
  connect(this, &TrimExporter::finished, &loop, &QEventLoop::quit, Qt::QueuedConnection);
  loop.exec();
}

template<typename Callback>
QProcess* TrimExporter::prepare(const QString& program, const QStringList& args, Callback&& onFinished)
{
  QProcess* process = createProcess(program, args, this);

  auto callback = [process, onFinished = std::forward<Callback>(onFinished)]() {
    onFinished(process);
  };

  connect(process, &QProcess::finished, this, callback);

  // finished() is not emitted when the program cannot be started
  connect(process, &QProcess::errorOccurred, this, [callback](QProcess::ProcessError error) {
    if (error == QProcess::FailedToStart)
    {
      callback();
    }
  });

  return process;
}

void TrimExporter::step()
{
  Q_ASSERT(d);

  switch (m_state)
  {
  case State::ProbingKeyframes: {
    auto on_keyframes_probed = [this](QProcess* process) {
      d->probe = nullptr;
      std::vector<double> keyframes;

      if (process_succeeded(process))
      {
        keyframes = parseKeyframes(QString::fromLocal8Bit(process->readAllStandardOutput()));
      }
      else
      {
        qWarning().noquote() << "keyframe probing failed, segments will be re-encoded:"
                             << process_diagnostics(process);
      }

      process->deleteLater();

      decideCopyMode(keyframes);
      setState(State::Extracting);
      step();
    };

    d->probe = prepare(m_options.tools.ffprobe,
                       keyframeProbeArguments(m_media.filePath),
                       on_keyframes_probed);
    d->probe->start();
    return;
  }

  case State::Extracting:
    launchPendingExtractions();
    return;

  case State::Concatenating:
    concatenate();
    return;

  default:
    return;
  }
}

void TrimExporter::onTimeout()
{
  fail(ErrorCode::Timeout,
       currentStepName(),
       -1,
       QString("export did not complete within %1 s").arg(m_options.timeout / 1000));
}

void TrimExporter::setState(State s)
{
  if (m_state == s)
  {
    return;
  }

  m_state = s;

  Q_EMIT statusChanged();
  Q_EMIT progressChanged();
}

void TrimExporter::decideCopyMode(const std::vector<double>& keyframes)
{
  if (m_options.copyPolicy == CopyPolicy::StreamCopy)
  {
    m_streamCopy = true;
    return;
  }

  const double tolerance = m_media.timeline.frameDelta() / 2;

  std::vector<double> starts;
  starts.reserve(m_keepSegments.size());

  for (size_t i(0); i < m_keepSegments.size(); ++i)
  {
    std::optional<double> keyframe = findKeyframeStart(m_keepSegments[i], keyframes, tolerance);

    if (!keyframe.has_value())
    {
      qDebug() << "segment" << (i + 1) << "does not start on a keyframe, re-encoding";
      m_streamCopy = false;
      return;
    }

    // a backward seek from just past the keyframe lands on it
    starts.push_back(*keyframe > 0 ? *keyframe + 0.001 : 0.0);
  }

  qDebug() << "all segments start on a keyframe, using stream copy";
  m_streamCopy = true;
  d->startTimes = std::move(starts);
}

void TrimExporter::launchPendingExtractions()
{
  const int n = int(m_keepSegments.size());
  const size_t max_jobs = std::max(1, m_options.maxParallelJobs);

  while (d && m_state == State::Extracting && d->extractions.size() < max_jobs
         && d->nextSegment < n)
  {
    const int index = d->nextSegment++;
    const TimeSegment& seg = m_keepSegments.at(index);

    const QStringList args = extractionArguments(m_media.filePath,
                                                 d->startTimes.at(index),
                                                 seg.end() / double(1000),
                                                 segmentFilePath(index),
                                                 m_streamCopy);

    QProcess* process = prepare(m_options.tools.ffmpeg, args, [this, index](QProcess* p) {
      onExtractionFinished(p, index);
    });

    d->extractions[process] = index;
    process->start();
  }
}

void TrimExporter::onExtractionFinished(QProcess* process, int index)
{
  d->extractions.erase(process);

  if (!process_succeeded(process))
  {
    const QString diagnostics = process_diagnostics(process);
    process->deleteLater();
    fail(ErrorCode::ExternalToolError, "extraction", index, diagnostics);
    return;
  }

  process->deleteLater();

  d->numberOfSegmentsExtracted += 1;

  if (d->numberOfSegmentsExtracted == int(m_keepSegments.size()))
  {
    setState(State::Concatenating);
    step();
  }
  else
  {
    Q_EMIT statusChanged();
    Q_EMIT progressChanged();
    launchPendingExtractions();
  }
}

void TrimExporter::concatenate()
{
  QFile listtxt{d->tempDir->filePath("list.txt")};
  if (!listtxt.open(QIODevice::WriteOnly | QIODevice::Truncate))
  {
    fail(ErrorCode::ExternalToolError,
         "concatenation",
         -1,
         QString("could not write %1: %2").arg(listtxt.fileName(), listtxt.errorString()));
    return;
  }

  for (size_t i(0); i < m_keepSegments.size(); ++i)
  {
    const QString name = QFileInfo(segmentFilePath(int(i))).fileName();
    listtxt.write(QString("file '%1'\n").arg(name).toUtf8());
  }

  listtxt.close();

  if (QFileInfo::exists(d->partialFilePath))
  {
    QFile::remove(d->partialFilePath);
  }

  d->concat = prepare(m_options.tools.ffmpeg,
                      concatenationArguments(listtxt.fileName(), d->partialFilePath),
                      [this](QProcess* p) { onConcatenationFinished(p); });
  d->concat->start();
}

void TrimExporter::onConcatenationFinished(QProcess* process)
{
  d->concat = nullptr;

  if (!process_succeeded(process))
  {
    const QString diagnostics = process_diagnostics(process);
    process->deleteLater();
    fail(ErrorCode::ExternalToolError, "concatenation", -1, diagnostics);
    return;
  }

  process->deleteLater();

  // the destination is moved aside and only deleted once the new file is in place
  QString backup;
  if (QFileInfo::exists(m_outputFilePath))
  {
    const QFileInfo output_info{m_outputFilePath};
    backup = output_info.dir().filePath(
        QString(".%1.backup.%2").arg(output_info.completeBaseName(), output_info.suffix()));

    if ((QFileInfo::exists(backup) && !QFile::remove(backup))
        || !QFile::rename(m_outputFilePath, backup))
    {
      fail(ErrorCode::ExternalToolError,
           "concatenation",
           -1,
           "could not replace " + m_outputFilePath);
      return;
    }
  }

  if (!QFile::rename(d->partialFilePath, m_outputFilePath))
  {
    if (!backup.isEmpty() && !QFile::rename(backup, m_outputFilePath))
    {
      qWarning() << "could not restore" << m_outputFilePath << "from" << backup;
    }

    fail(ErrorCode::ExternalToolError,
         "concatenation",
         -1,
         QString("could not rename %1 to %2").arg(d->partialFilePath, m_outputFilePath));
    return;
  }

  if (!backup.isEmpty() && !QFile::remove(backup))
  {
    qWarning() << "could not remove" << backup;
  }

  succeed();
}

void TrimExporter::succeed()
{
  qDebug() << "Export complete:" << m_outputFilePath;

  d.reset();
  setState(State::Done);
  Q_EMIT finished(true);
}

void TrimExporter::fail(ErrorCode code, const QString& step, int index, const QString& diagnostics)
{
  if (m_state == State::Failed || m_state == State::Done)
  {
    return;
  }

  m_failure.code = code;
  m_failure.step = step;
  m_failure.segmentIndex = index;
  m_failure.segment = index >= 0 ? m_keepSegments.at(index) : TimeSegment();
  m_failure.diagnostics = diagnostics;

  qWarning().noquote() << "Export failed:" << m_failure.toString();

  if (d)
  {
    terminateProcesses();

    if (!d->partialFilePath.isEmpty() && QFileInfo::exists(d->partialFilePath))
    {
      QFile::remove(d->partialFilePath);
    }

    d.reset();
  }

  setState(State::Failed);
  Q_EMIT finished(false);
}

void TrimExporter::terminateProcesses()
{
  std::vector<QProcess*> processes;

  for (const auto& p : d->extractions)
  {
    processes.push_back(p.first);
  }

  if (d->probe)
  {
    processes.push_back(d->probe);
  }

  if (d->concat)
  {
    processes.push_back(d->concat);
  }

  d->extractions.clear();
  d->probe = nullptr;
  d->concat = nullptr;
  d->timer.stop();

  for (QProcess* process : processes)
  {
    disconnect(process, nullptr, this, nullptr);

    if (process->state() != QProcess::NotRunning)
    {
      qDebug() << "killing" << process->program();
      process->kill();
      process->waitForFinished(5000);
    }

    process->deleteLater();
  }
}

QString TrimExporter::segmentFilePath(int index) const
{
  return d->tempDir->filePath(QString("seg-%1.%2").arg(index).arg(d->extension));
}

QString TrimExporter::currentStepName() const
{
  switch (m_state)
  {
  case State::ProbingKeyframes:
    return "keyframe probing";
  case State::Extracting:
    return "extraction";
  case State::Concatenating:
    return "concatenation";
  default:
    return "export";
  }
}

bool exportTrimmed(const MediaInfo& media,
                   const std::vector<TimeSegment>& keepSegments,
                   const QString& outputFilePath,
                   const ExportOptions& options,
                   ExportFailure* failure)
{
  TrimExporter exporter{media, keepSegments};
  exporter.setOutputFilePath(outputFilePath);
  exporter.setOptions(options);

  if (exporter.run())
  {
    exporter.waitForFinished();
  }

  if (exporter.state() == TrimExporter::State::Done)
  {
    return true;
  }

  if (failure)
  {
    *failure = exporter.failure();
  }

  return false;
}
