
#include "cache.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

QString GetCacheDir()
{
  return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

void CreateCacheDir()
{
  const QString path = GetCacheDir();
  if (!QFileInfo::exists(path))
  {
    QDir().mkpath(path);
  }
}

QString GetCacheFileName(const QFileInfo& mediaFile, const QString& suffix)
{
  return GetCacheDir() + "/" + mediaFile.fileName() + "." + QString::number(mediaFile.size())
         + "." + QString::number(mediaFile.lastModified().toSecsSinceEpoch()) + "." + suffix;
}
