#include "timesegment.h"

#include <QString>
#include <QStringList>

#include <cmath>

Duration Duration::fromSeconds(double seconds)
{
  return Duration(std::llround(seconds * 1000));
}

static void append_padded(QString& text, int64_t value, int width)
{
  text += QString::number(value).rightJustified(width, '0');
}

QString Duration::toString(Format format) const
{
  const int64_t val = toMSecs();

  if (val < 0)
  {
    return "-" + Duration(-val).toString(format);
  }

  if (format == Format::Seconds)
  {
    QString text = QString::number(val / 1000) + ".";
    append_padded(text, val % 1000, 3);
    return text;
  }

  const int64_t h = val / (3600 * 1000);
  const int64_t m = (val / (60 * 1000)) % 60;
  const int64_t s = (val / 1000) % 60;

  QString text;

  if (h > 0)
  {
    text += QString::number(h) + ":";
    append_padded(text, m, 2);
  }
  else
  {
    text += QString::number(m);
  }

  text += ":";
  append_padded(text, s, 2);
  text += ".";
  append_padded(text, val % 1000, 3);

  return text;
}

Duration Duration::fromString(const QString& text)
{
  Duration d{0};
  if (!d.parse(text))
  {
    d.m_value = -1;
  }
  return d;
}

bool Duration::parse(const QString& text)
{
  const QString trimmed = text.trimmed();

  if (trimmed.isEmpty())
  {
    m_value = 0;
    return true;
  }

  QStringList parts = trimmed.split(':', Qt::KeepEmptyParts);

  if (parts.size() > 3)
  {
    return false;
  }

  bool ok = false;
  const double seconds = parts.back().toDouble(&ok);
  if (!ok || seconds < 0)
  {
    return false;
  }

  int64_t result = std::llround(seconds * 1000);
  parts.pop_back();

  int64_t multiplier = 60 * 1000;
  while (!parts.empty())
  {
    const int64_t n = parts.back().toLongLong(&ok);
    if (!ok || n < 0)
    {
      return false;
    }

    result += n * multiplier;
    multiplier *= 60;
    parts.pop_back();
  }

  m_value = result;
  return true;
}

QString TimeSegment::toString() const
{
  return Duration(start()).toString(Duration::HHMMSSzzz) + "-"
         + Duration(end()).toString(Duration::HHMMSSzzz);
}

TimeSegment TimeSegment::fromString(const QString& text, bool* ok)
{
  if (ok)
  {
    *ok = false;
  }

  const QStringList parts = text.split('-', Qt::KeepEmptyParts);
  if (parts.size() != 2 || parts.front().trimmed().isEmpty() || parts.back().trimmed().isEmpty())
  {
    return TimeSegment();
  }

  Duration start{0};
  Duration end{0};
  if (!start.parse(parts.front()) || !end.parse(parts.back()))
  {
    return TimeSegment();
  }

  if (ok)
  {
    *ok = true;
  }

  return TimeSegment(start.toMSecs(), end.toMSecs());
}
