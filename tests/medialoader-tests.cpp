#include "medialoader.h"

#include "cache.h"
#include "mediaprobe.h"

#include "testing.h"

#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTimer>

namespace {

const char* FFPROBE_OUTPUT = R"([STREAM]
codec_type=video
r_frame_rate=30000/1001
[/STREAM]
[STREAM]
codec_type=audio
r_frame_rate=0/0
[/STREAM]
[FORMAT]
duration=12.500000
TAG:title=Holiday
[/FORMAT]
)";

struct Fixture
{
  QTemporaryDir dir;
  QString video;
  ExternalTools tools;

  Fixture()
  {
    require(dir.isValid(), "temporary directory");

    QDir(GetCacheDir()).removeRecursively();
    CreateCacheDir();

    video = dir.filePath("video.mp4");
    QFile file{video};
    require(file.open(QIODevice::WriteOnly), "create video file");
    file.write("not really a video");
    file.close();

    std::vector<int16_t> samples(4410);
    for (size_t i(0); i < samples.size(); ++i)
    {
      samples[i] = int16_t((i % 2 == 0) ? 8192 : -8192);
    }
    writeWav(dir.filePath("audio.wav"), samples);

    setFFprobe(QByteArray("cat <<'EOF'\n") + FFPROBE_OUTPUT + "EOF\n");
    tools.ffmpeg = writeScript(dir.filePath("ffmpeg"),
                               "for last; do :; done\n"
                               "echo \"$*\" >> \"$(dirname \"$0\")/ffmpeg.log\"\n"
                               "cp \"$(dirname \"$0\")/audio.wav\" \"$last\"\n");
  }

  void setFFprobe(const QByteArray& body)
  {
    tools.ffprobe = writeScript(dir.filePath("ffprobe"), body);
  }

  int ffmpegRuns() const
  {
    QFile file{dir.filePath("ffmpeg.log")};
    if (!file.open(QIODevice::ReadOnly))
      return 0;
    return file.readAll().count('\n');
  }
};

void test_probe_output()
{
  Fixture f;

  const MediaInfo info = probeMedia(f.video, f.tools);
  require(info.filePath == f.video, "file path");
  require(info.title == "Holiday", "title tag");
  require(info.hasAudio, "audio stream");
  require(info.timeline.durationMSecs() == 12500, "duration");
  require(info.timeline.frameRateAsRational() == std::make_pair(30000, 1001), "frame rate");

  bool thrown = false;
  try
  {
    probeMedia(f.dir.filePath("missing.mp4"), f.tools);
  } catch (const LoadError&)
  {
    thrown = true;
  }
  require(thrown, "missing file rejected");

  f.setFFprobe("printf '[STREAM]\\ncodec_type=audio\\n[/STREAM]\\nduration=3.0\\n'\n");
  thrown = false;
  try
  {
    probeMedia(f.video, f.tools);
  } catch (const LoadError& ex)
  {
    thrown = QString(ex.what()).contains("no video stream");
  }
  require(thrown, "audio-only file rejected");
}

void test_parse_keyframes()
{
  const std::vector<double> keyframes = parseKeyframes("4.000000,K__\n"
                                                       "0.000000,K__\n"
                                                       "0.040000,___\n"
                                                       "garbage\n"
                                                       "2.002000,K_D\n");
  require(keyframes == std::vector<double>({0, 2.002, 4}), "sorted keyframe times");
}

void test_load()
{
  Fixture f;

  MediaLoader loader;
  loader.setTools(f.tools);
  loader.setBucketCount(100);

  std::vector<int> steps;
  bool loaded = false;
  MediaLoadResult result;

  QObject::connect(&loader, &MediaLoader::progressChanged, [&](int percent, const QString&) {
    require(!loaded, "progress reported before completion");
    steps.push_back(percent);
  });
  QObject::connect(&loader, &MediaLoader::loaded, [&](const MediaLoadResult& r) {
    loaded = true;
    result = r;
  });

  require(loader.load(f.video), "load started");
  require(loader.isLoading(), "loading");
  require(!loader.load(f.video), "second load refused while busy");

  loader.waitForFinished();

  require(loaded, "loaded");
  require(!loader.isLoading(), "idle after completion");
  require(steps == std::vector<int>({10, 30, 60, 100}), "progress steps");
  require(result.media.timeline.durationMSecs() == 12500, "media info");
  require(result.peaks.size() == 100, "waveform peaks");
  require(result.peaks.front().max == 0.25f && result.peaks.front().min == -0.25f, "peak values");
  require(f.ffmpegRuns() == 1, "audio extracted once");

  steps.clear();
  loaded = false;
  require(loader.load(f.video), "reload started");
  loader.waitForFinished();

  require(loaded, "reloaded");
  require(steps == std::vector<int>({10, 100}), "waveform read from cache");
  require(result.peaks.size() == 100, "cached peaks");
  require(f.ffmpegRuns() == 1, "no second audio extraction");
}

void test_load_failure()
{
  Fixture f;
  f.setFFprobe("echo 'Invalid data found when processing input' >&2\nexit 1\n");

  MediaLoader loader;
  loader.setTools(f.tools);

  QString message;
  bool loaded = false;
  QObject::connect(&loader, &MediaLoader::failed, [&](const QString&, const QString& m) {
    message = m;
  });
  QObject::connect(&loader, &MediaLoader::loaded, [&](const MediaLoadResult&) { loaded = true; });

  require(loader.load(f.video), "load started");
  loader.waitForFinished();

  require(!loaded, "not loaded");
  require(message.contains("Invalid data found"), "ffprobe error reported");
  require(!loader.isLoading(), "idle after failure");
}

void test_cancel()
{
  Fixture f;
  f.setFFprobe("sleep 5\n");

  MediaLoader loader;
  loader.setTools(f.tools);

  bool canceled = false, failed = false;
  QObject::connect(&loader, &MediaLoader::canceled, [&](const QString&) { canceled = true; });
  QObject::connect(&loader, &MediaLoader::failed, [&](const QString&, const QString&) {
    failed = true;
  });

  require(loader.load(f.video), "load started");
  QTimer::singleShot(100, &loader, &MediaLoader::cancel);
  loader.waitForFinished();

  require(canceled && !failed, "load canceled");
  require(!loader.isLoading(), "idle after cancel");
}

} // namespace

int main(int argc, char* argv[])
{
  QCoreApplication app{argc, argv};
  QCoreApplication::setApplicationName("snipper-tests");
  QStandardPaths::setTestModeEnabled(true);

  test_probe_output();
  test_parse_keyframes();
  test_load();
  test_load_failure();
  test_cancel();
  return 0;
}
