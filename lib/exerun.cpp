#include "exerun.h"

#include <QElapsedTimer>

QString commandLine(const QString& name, const QStringList& args)
{
  return (QStringList() << name << args).join(" ");
}

QProcess* createProcess(const QString& name, const QStringList& args, QObject* parent)
{
  qDebug().noquote() << commandLine(name, args);

  auto* process = new QProcess(parent);
  process->setProgram(name);
  process->setArguments(args);
  return process;
}

int exec(const QString& name,
         const QStringList& args,
         QString* stdOut,
         QString* stdErr,
         const std::function<bool()>& interrupted,
         int timeout)
{
  qDebug().noquote() << commandLine(name, args);

  QProcess process;
  process.setProgram(name);
  process.setArguments(args);
  process.start();

  auto fail = [&](const QString& reason) {
    if (stdErr)
    {
      *stdErr = reason;
    }
    qWarning().noquote() << name << ":" << reason;
    return -1;
  };

  if (!process.waitForStarted())
  {
    return fail(process.errorString());
  }

  QElapsedTimer timer;
  timer.start();

  while (!process.waitForFinished(100))
  {
    if (process.state() == QProcess::NotRunning)
    {
      break;
    }

    if (interrupted && interrupted())
    {
      process.kill();
      process.waitForFinished();
      return fail("interrupted");
    }

    if (timeout > 0 && timer.elapsed() > timeout)
    {
      process.kill();
      process.waitForFinished();
      return fail("timed out");
    }
  }

  const QString err = QString::fromLocal8Bit(process.readAllStandardError());

  if (stdOut)
  {
    *stdOut = QString::fromLocal8Bit(process.readAllStandardOutput());
  }

  if (stdErr)
  {
    *stdErr = err;
  }

  if (process.exitStatus() == QProcess::CrashExit)
  {
    return fail(err.isEmpty() ? QString("crashed") : err);
  }

  if (process.exitCode() != 0)
  {
    qDebug().noquote() << err;
  }

  return process.exitCode();
}
