// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef VIDEOPLAYERWIDGET_H
#define VIDEOPLAYERWIDGET_H

#include <QWidget>

class QAudioOutput;
class QMediaPlayer;
class QToolButton;
class QVideoWidget;

class Session;
class PlayerBar;
class TimeDisplay;

class VideoPlayerWidget : public QWidget
{
  Q_OBJECT
public:
  VideoPlayerWidget();
  ~VideoPlayerWidget();

  Session* session() const;
  void setSession(Session* session);

  QMediaPlayer* player() const;

  int64_t position() const;

public Q_SLOTS:
  void play();
  void pause();
  void stop();
  void togglePlay();
  void stepForward();
  void stepBackward();
  void seekForward();
  void seekBackward();
  void seekTime(double val);
  void seek(int64_t val);

Q_SIGNALS:
  void positionChanged(int64_t pos);

protected Q_SLOTS:
  void onMediaPlayerPositionChanged(qint64 pos);
  void onPlaybackStateChanged();
  void onRegionsChanged();

private:
  Session* m_session = nullptr;
  QMediaPlayer* m_player = nullptr;
  QVideoWidget* m_video_widget = nullptr;
  QAudioOutput* m_audio_output = nullptr;
  PlayerBar* m_playerBar = nullptr;
  TimeDisplay* m_timeDisplay = nullptr;
  QToolButton* m_play_button = nullptr;
  QToolButton* m_stop_button = nullptr;
  QToolButton* m_stepForwardButton = nullptr;
  QToolButton* m_stepBackwardButton = nullptr;
};

#endif // VIDEOPLAYERWIDGET_H
