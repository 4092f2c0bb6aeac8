#include "playerbar.h"

#include "timelinemapper.h"

#include <QBrush>
#include <QPainter>
#include <QPen>

#include <QPaintEvent>

#include <algorithm>
#include <cmath>
#include <utility>

PlayerBar::PlayerBar(QWidget *parent)
    : QWidget(parent)
{
  setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
  setFixedHeight(7);
  setMinimumWidth(100);

  setMouseTracking(true);
}

PlayerBar::~PlayerBar() {}

void PlayerBar::setRange(double min, double max)
{
  bool u = false;

  if (std::exchange(m_min, min) != min)
  {
    u = true;
  }

  if (std::exchange(m_max, max) != max)
  {
    u = true;
  }

  if (u)
  {
    update();
  }
}

double PlayerBar::value() const
{
  return m_val;
}

void PlayerBar::setValue(double v)
{
  if (!qFuzzyCompare(v, m_val))
  {
    m_val = v;
    update();
  }
}

void PlayerBar::setRegions(const std::vector<TimeSegment> &regions)
{
  m_regions = regions;
  update();
}

void PlayerBar::paintEvent(QPaintEvent *event)
{
  Q_UNUSED(event);

  const double span = m_max - m_min;
  const double x = timeToPixel(value() - m_min, width(), span);

  QPainter painter{this};
  painter.setPen(Qt::NoPen);

  painter.setBrush(QBrush(QColor("#aeaeae")));
  painter.drawRect(this->rect());

  painter.setBrush(QBrush(QColor("#e6e6e6")));
  painter.drawRect(QRect(0, 1, this->width(), this->height() - 2));

  painter.setBrush(QBrush(QColor("#0078d7")));
  painter.drawRect(QRect(0, 1, std::round(x), this->height() - 2));

  painter.setBrush(QBrush(QColor(220, 40, 40, 160)));
  for (const TimeSegment &region : m_regions)
  {
    const double x1 = timeToPixel(region.start() / 1000.0 - m_min, width(), span);
    const double x2 = timeToPixel(region.end() / 1000.0 - m_min, width(), span);
    painter.drawRect(QRectF(x1, 0, std::max(1.0, x2 - x1), height()));
  }
}

void PlayerBar::mousePressEvent(QMouseEvent *event)
{
  event->accept();
}

void PlayerBar::mouseMoveEvent(QMouseEvent *event)
{
  event->accept();

  const double pos = positionAt(event->position().x());
  setToolTip(Duration::fromSeconds(pos).toString(Duration::HHMMSSzzz));
}

void PlayerBar::mouseReleaseEvent(QMouseEvent *event)
{
  event->accept();

  Q_EMIT clicked(positionAt(event->position().x()));
}

double PlayerBar::positionAt(double x) const
{
  return m_min + pixelToTime(x, width(), m_max - m_min);
}

TimeDisplay::TimeDisplay(QWidget *parent)
    : QLabel(parent)
{
  QFont font = this->font();
  font.setWeight(QFont::Bold);
  setFont(font);

  setSizePolicy(QSizePolicy::Fixed, QSizePolicy::Fixed);

  update();
}

TimeDisplay::~TimeDisplay() {}

void TimeDisplay::setMax(qint64 val)
{
  if (m_max != val)
  {
    m_max = val;
    update();
  }
}

void TimeDisplay::setCurrent(qint64 val)
{
  if (m_current != val)
  {
    m_current = val;
    update();
  }
}

void TimeDisplay::update()
{
  setText(Duration(m_current).toString(Duration::HHMMSSzzz) + " / "
          + Duration(m_max).toString(Duration::HHMMSSzzz));
}
