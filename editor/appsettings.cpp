#include "appsettings.h"

#include <QDebug>

#include <algorithm>

AppSettings::AppSettings(QObject* parent)
    : QObject(parent)
{}

AppSettings* AppSettings::getInstance(QObject* parent)
{
  return parent->findChild<AppSettings*>();
}

void AppSettings::setValue(const QString& key, const QVariant& value)
{
  const QVariant oldval = this->value(key);
  if (oldval != value)
  {
    m_settings.setValue(key, value);
    Q_EMIT valueChanged(key, value, oldval);
  }
}

ExternalTools AppSettings::tools() const
{
  ExternalTools result;
  result.ffmpeg = value<QString>(FFMPEG_PATH_KEY, FFMPEG_PATH_DEFAULT);
  result.ffprobe = value<QString>(FFPROBE_PATH_KEY, FFPROBE_PATH_DEFAULT);
  return result;
}

ExportOptions AppSettings::exportOptions() const
{
  ExportOptions options;
  options.tools = tools();

  bool ok = false;
  const QString policy = value<QString>(EXPORT_COPY_POLICY_KEY, EXPORT_COPY_POLICY_DEFAULT);
  options.copyPolicy = copyPolicyFromString(policy, &ok);
  if (!ok)
  {
    qWarning() << "invalid value for" << EXPORT_COPY_POLICY_KEY << ":" << policy;
  }

  options.maxParallelJobs = std::max(1,
                                     value<int>(EXPORT_PARALLEL_JOBS_KEY,
                                                EXPORT_PARALLEL_JOBS_DEFAULT));
  options.timeout = std::max(0, value<int>(EXPORT_TIMEOUT_KEY, EXPORT_TIMEOUT_DEFAULT)) * 60
                    * 1000;

  return options;
}

int AppSettings::waveformBuckets() const
{
  return std::max(1, value<int>(WAVEFORM_BUCKETS_KEY, WAVEFORM_BUCKETS_DEFAULT));
}

SettingsWatcher::SettingsWatcher(AppSettings& settings, const QString& key)
    : QObject(nullptr)
    , m_settings(settings)
    , m_key(key)
{
  connect(&settings, &AppSettings::valueChanged, this, &SettingsWatcher::onSettingValueChanged);
}

AppSettings& SettingsWatcher::settings() const
{
  return m_settings;
}

const QString& SettingsWatcher::key() const
{
  return m_key;
}

void SettingsWatcher::onSettingValueChanged(const QString& key,
                                            const QVariant& newValue,
                                            const QVariant& oldValue)
{
  if (m_key == key)
  {
    Q_EMIT valueChanged(newValue, oldValue);
  }
}
