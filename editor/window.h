// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef WINDOW_H
#define WINDOW_H

#include "timesegment.h"

#include <QMainWindow>

class QAction;
class QDialog;
class QSettings;
class QProgressDialog;

class AppSettings;
class MediaLoader;
struct MediaLoadResult;
class Session;

class CutListWindow;
class TimelineWidget;
class VideoPlayerWidget;

class MainWindow : public QMainWindow
{
  Q_OBJECT
public:
  MainWindow();
  ~MainWindow();

  QSettings& settings() const;
  AppSettings& appSettings() const;

  Session* session() const;

  QString getLastOpenDir() const;
  void updateLastOpenDir(const QString& path);

  void openFile(const QString& filePath);

public Q_SLOTS:
  void about();

protected Q_SLOTS:
  void actOpen();
  void doExport();
  void toggleCutListPopup();
  void placeMarkerAtPlayhead();
  void placeMarkerAt(int64_t pos);
  void removeLastMarker();
  void deleteRegionAtPlayhead();
  void clearMarkers();

protected:
  void closeEvent(QCloseEvent* event) override;

private Q_SLOTS:
  void refreshUi();
  void updateWindowTitle();
  void onLoadProgressChanged(int percent, const QString& status);
  void onMediaLoaded(const MediaLoadResult& result);
  void onMediaLoadFailed(const QString& filePath, const QString& message);
  void onMediaLoadCanceled(const QString& filePath);

private:
  void setSession(Session* session);
  void closeLoadProgressDialog();
  void updateLastSaveDir(const QString& filePath);
  void showStatus(const QString& message);

private:
  QSettings* m_settings = nullptr;
  AppSettings* m_appSettings = nullptr;
  MediaLoader* m_loader = nullptr;
  Session* m_session = nullptr;
  QProgressDialog* m_loadProgress = nullptr;
  struct
  {
    QAction* openVideo = nullptr;
    QAction* exportVideo = nullptr;
    QAction* placeMarker = nullptr;
    QAction* removeLastMarker = nullptr;
    QAction* deleteRegion = nullptr;
    QAction* clearMarkers = nullptr;
    QAction* playPause = nullptr;
    QAction* stepForward = nullptr;
    QAction* stepBackward = nullptr;
    QAction* seekForward = nullptr;
    QAction* seekBackward = nullptr;
    QAction* toggleCutListWindow = nullptr;
  } m_actions;
  VideoPlayerWidget* m_player = nullptr;
  TimelineWidget* m_timeline = nullptr;
  CutListWindow* m_cutListWindow = nullptr;
  QDialog* m_aboutDialog = nullptr;
};

inline Session* MainWindow::session() const
{
  return m_session;
}

#endif // WINDOW_H
