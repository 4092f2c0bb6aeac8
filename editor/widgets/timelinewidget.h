// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QWidget>

#include <cstdint>
#include <utility>

class Session;

// Waveform of the session's media with its cut regions, the pending
// marker and the playhead.
class TimelineWidget : public QWidget
{
  Q_OBJECT
public:
  explicit TimelineWidget(QWidget *parent = nullptr);
  ~TimelineWidget();

  Session *session() const;
  void setSession(Session *session);

  int64_t duration() const;

  int64_t position() const;
  void setPosition(int64_t pos);

  double zoom() const;
  void setZoom(double zoom);

  int contentWidth() const;
  std::pair<int64_t, int64_t> visibleRange() const;
  int64_t convertCursorPosToVideoPosition(double cursorX) const;
  double convertVideoPositionToCursorPos(int64_t pos) const;

Q_SIGNALS:
  void clicked(int64_t pos);

protected:
  void paintEvent(QPaintEvent *event) override;
  void resizeEvent(QResizeEvent *event) override;

  void mousePressEvent(QMouseEvent *event) override;
  void mouseMoveEvent(QMouseEvent *event) override;
  void mouseReleaseEvent(QMouseEvent *event) override;
  void wheelEvent(QWheelEvent *event) override;

private:
  void setScroll(double px);
  void ensurePositionIsVisible();

private:
  Session *m_session = nullptr;
  int64_t m_position = 0;
  double m_zoom = 1;
  double m_scrollInPixel = 0;
};
