#include "timelinewidget.h"

#include "session.h"
#include "timelinemapper.h"

#include <QBrush>
#include <QPainter>
#include <QPen>

#include <QMouseEvent>
#include <QPaintEvent>
#include <QWheelEvent>

#include <algorithm>
#include <cmath>

constexpr double MAX_ZOOM = 256;

TimelineWidget::TimelineWidget(QWidget *parent)
    : QWidget(parent)
{
  setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
  setFixedHeight(96);
  setMinimumWidth(100);

  setMouseTracking(true);
}

TimelineWidget::~TimelineWidget() {}

Session *TimelineWidget::session() const
{
  return m_session;
}

void TimelineWidget::setSession(Session *session)
{
  if (m_session)
  {
    disconnect(&m_session->markers(), nullptr, this, nullptr);
  }

  m_session = session;
  m_position = 0;
  m_zoom = 1;
  m_scrollInPixel = 0;

  if (m_session)
  {
    connect(&m_session->markers(),
            &MarkerStore::changed,
            this,
            qOverload<>(&TimelineWidget::update));
  }

  update();
}

int64_t TimelineWidget::duration() const
{
  return m_session ? m_session->timeline().durationMSecs() : 0;
}

int64_t TimelineWidget::position() const
{
  return m_position;
}

void TimelineWidget::setPosition(int64_t pos)
{
  pos = std::clamp<int64_t>(pos, 0, duration());

  if (m_position != pos)
  {
    m_position = pos;
    ensurePositionIsVisible();
    update();
  }
}

double TimelineWidget::zoom() const
{
  return m_zoom;
}

void TimelineWidget::setZoom(double zoom)
{
  zoom = std::clamp(zoom, 1.0, MAX_ZOOM);

  if (zoom != m_zoom)
  {
    // keep the playhead at the same place on screen
    const double offset = convertVideoPositionToCursorPos(position());
    m_zoom = zoom;
    const double x = timeToPixel(position() / 1000.0, contentWidth(), duration() / 1000.0);
    setScroll(x - offset);
    update();
  }
}

int TimelineWidget::contentWidth() const
{
  return std::round(width() * m_zoom);
}

std::pair<int64_t, int64_t> TimelineWidget::visibleRange() const
{
  return std::pair(convertCursorPosToVideoPosition(0), convertCursorPosToVideoPosition(width()));
}

int64_t TimelineWidget::convertCursorPosToVideoPosition(double cursorX) const
{
  const double t = pixelToTime(m_scrollInPixel + cursorX, contentWidth(), duration() / 1000.0);
  return std::llround(t * 1000);
}

double TimelineWidget::convertVideoPositionToCursorPos(int64_t pos) const
{
  return timeToPixel(pos / 1000.0, contentWidth(), duration() / 1000.0) - m_scrollInPixel;
}

void TimelineWidget::paintEvent(QPaintEvent *event)
{
  Q_UNUSED(event);

  QPainter painter{this};
  painter.setPen(Qt::NoPen);

  painter.setBrush(QBrush(Qt::black));
  painter.drawRect(this->rect());

  if (!m_session)
  {
    return;
  }

  const double seconds = m_session->timeline().duration();
  const WaveformPeaks &peaks = m_session->peaks();

  if (!peaks.empty())
  {
    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(Qt::yellow));

    const int half = height() / 2;

    for (int x(0); x < width(); ++x)
    {
      const double t = pixelToTime(x + m_scrollInPixel, contentWidth(), seconds);
      const WavePeak *peak = peakForTime(peaks, t, seconds);

      if (peak)
      {
        const int ymin = half - std::round(half * peak->max);
        const int ymax = half - std::round(half * peak->min);
        painter.drawLine(x, ymin, x, ymax);
      }
    }
  }

  const MarkerStore &markers = m_session->markers();

  painter.setPen(Qt::NoPen);
  painter.setBrush(QBrush(QColor(220, 40, 40, 110)));

  for (const TimeSegment &region : markers.regions())
  {
    const double x1 = convertVideoPositionToCursorPos(region.start());
    const double x2 = convertVideoPositionToCursorPos(region.end());

    if (x2 >= 0 && x1 <= width())
    {
      painter.drawRect(QRectF(x1, 0, std::max(1.0, x2 - x1), height()));
    }
  }

  if (markers.hasPendingMarker())
  {
    const double x = convertVideoPositionToCursorPos(*markers.pendingMarker());
    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(QColor(255, 150, 0), 2, Qt::DashLine));
    painter.drawLine(QPointF(x, 0), QPointF(x, height()));
  }

  // draw current pos
  {
    const auto [start, end] = visibleRange();
    if (position() >= start && position() <= end)
    {
      const double x = convertVideoPositionToCursorPos(position());

      painter.setBrush(Qt::NoBrush);
      painter.setPen(QPen(Qt::white));
      painter.drawLine(QPointF(x, 0), QPointF(x, height()));
    }
  }
}

void TimelineWidget::resizeEvent(QResizeEvent *event)
{
  QWidget::resizeEvent(event);
  setScroll(m_scrollInPixel);
}

void TimelineWidget::mousePressEvent(QMouseEvent *event)
{
  event->accept();
}

void TimelineWidget::mouseMoveEvent(QMouseEvent *event)
{
  event->accept();

  if (!m_session)
  {
    return;
  }

  const int64_t pos = convertCursorPosToVideoPosition(event->position().x());
  setToolTip(Duration(pos).toString(Duration::HHMMSSzzz));
}

void TimelineWidget::mouseReleaseEvent(QMouseEvent *event)
{
  event->accept();

  if (!m_session || event->button() != Qt::LeftButton)
  {
    return;
  }

  Q_EMIT clicked(convertCursorPosToVideoPosition(event->position().x()));
}

void TimelineWidget::wheelEvent(QWheelEvent *event)
{
  event->accept();

  const int delta = event->angleDelta().y();
  if (delta == 0 || !m_session)
  {
    return;
  }

  if (event->modifiers() & Qt::ControlModifier)
  {
    setZoom(delta > 0 ? m_zoom * 1.25 : m_zoom / 1.25);
  }
  else
  {
    setScroll(m_scrollInPixel - delta / 2.0);
    update();
  }
}

void TimelineWidget::setScroll(double px)
{
  m_scrollInPixel = std::clamp(px, 0.0, double(std::max(0, contentWidth() - width())));
}

void TimelineWidget::ensurePositionIsVisible()
{
  const double x = convertVideoPositionToCursorPos(position());

  if (x >= 0 && x <= width())
  {
    return;
  }

  // page so that the playhead ends up near the left edge
  setScroll(m_scrollInPixel + x - width() / 10.0);
}
