// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QString>

class QFileInfo;

QString GetCacheDir();
void CreateCacheDir();

// name of the cache entry for a given media file, changes whenever
// the file is modified
QString GetCacheFileName(const QFileInfo& mediaFile, const QString& suffix);
