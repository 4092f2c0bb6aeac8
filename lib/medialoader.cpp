#include "medialoader.h"

#include <QEventLoop>

#include <algorithm>

MediaLoader::MediaLoader(QObject* parent)
    : QObject(parent)
{}

MediaLoader::~MediaLoader()
{
  if (m_thread)
  {
    disconnect(m_thread.get(), nullptr, this, nullptr);
    m_thread->requestInterruption();
    m_thread->wait();
  }
}

const ExternalTools& MediaLoader::tools() const
{
  return m_tools;
}

void MediaLoader::setTools(const ExternalTools& tools)
{
  m_tools = tools;
}

int MediaLoader::bucketCount() const
{
  return m_bucketCount;
}

void MediaLoader::setBucketCount(int n)
{
  m_bucketCount = std::max(1, n);
}

bool MediaLoader::load(const QString& filePath)
{
  if (isLoading())
  {
    qDebug() << "a video is already being loaded:" << m_filePath;
    return false;
  }

  m_filePath = filePath;
  m_canceled = false;

  m_thread = std::make_unique<MediaLoadThread>(filePath, m_tools, m_bucketCount);
  connect(m_thread.get(),
          &MediaLoadThread::progressChanged,
          this,
          &MediaLoader::onThreadProgressChanged,
          Qt::QueuedConnection);
  connect(m_thread.get(),
          &QThread::finished,
          this,
          &MediaLoader::onThreadFinished,
          Qt::QueuedConnection);
  m_thread->start();

  return true;
}

bool MediaLoader::isLoading() const
{
  return m_thread != nullptr;
}

const QString& MediaLoader::currentFilePath() const
{
  return m_filePath;
}

void MediaLoader::cancel()
{
  if (!isLoading() || m_canceled)
  {
    return;
  }

  qDebug() << "canceling load of" << m_filePath;

  m_canceled = true;
  m_thread->requestInterruption();
}

void MediaLoader::waitForFinished()
{
  if (!isLoading())
  {
    return;
  }

  QEventLoop loop;
  connect(this, &MediaLoader::loaded, &loop, &QEventLoop::quit);
  connect(this, &MediaLoader::failed, &loop, &QEventLoop::quit);
  connect(this, &MediaLoader::canceled, &loop, &QEventLoop::quit);
  loop.exec();
}

void MediaLoader::onThreadProgressChanged(int percent, const QString& status)
{
  if (!m_canceled)
  {
    Q_EMIT progressChanged(percent, status);
  }
}

void MediaLoader::onThreadFinished()
{
  std::unique_ptr<MediaLoadThread> thread = std::move(m_thread);
  const QString path = thread->filePath();
  const bool was_canceled = m_canceled;
  m_canceled = false;

  if (was_canceled)
  {
    thread.release()->deleteLater();
    Q_EMIT canceled(path);
  }
  else if (thread->succeeded())
  {
    MediaLoadResult result = std::move(thread->result());
    thread.release()->deleteLater();
    Q_EMIT loaded(result);
  }
  else
  {
    const QString message = thread->errorString();
    thread.release()->deleteLater();
    Q_EMIT failed(path, message);
  }
}
