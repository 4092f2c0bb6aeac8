// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QProcess>

#include <QStringList>

#include <QDebug>

#include <functional>

// Program names (or paths) of the external tools.
struct ExternalTools
{
  QString ffmpeg = "ffmpeg";
  QString ffprobe = "ffprobe";
};

constexpr int DEFAULT_PROCESS_TIMEOUT = 20 * 60 * 1000;

QString commandLine(const QString& name, const QStringList& args);

// creates a process configured to run the given command, the caller starts it
QProcess* createProcess(const QString& name, const QStringList& args, QObject* parent = nullptr);

// Runs a process to completion and returns its exit code.
// Returns -1 if the process could not be started, crashed, timed out or was
// interrupted; stdErr then receives a description of the failure.
// interrupted() is polled while the process runs; returning true kills it.
int exec(const QString& name,
         const QStringList& args,
         QString* stdOut = nullptr,
         QString* stdErr = nullptr,
         const std::function<bool()>& interrupted = {},
         int timeout = DEFAULT_PROCESS_TIMEOUT);
