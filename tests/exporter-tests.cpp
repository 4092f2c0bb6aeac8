#include "exporter.h"

#include "testing.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTimer>

namespace {

// Fake ffmpeg: logs its arguments, fails on the extraction of segment 'FAIL_SEGMENT'
// (if set) and writes to the output file otherwise. CONCAT=fail makes the
// concatenation fail, CONCAT=nooutput makes it succeed without writing anything.
const char* FAKE_FFMPEG = R"(
for last; do :; done
echo "$*" >> "$(dirname "$0")/ffmpeg.log"
if [ -n "$SLEEP" ]; then sleep "$SLEEP"; fi
case "$*" in
  *"-f concat"*)
    case "$CONCAT" in
      fail) echo "simulated concatenation error" >&2; exit 1 ;;
      nooutput) ;;
      *) echo concatenated > "$last" ;;
    esac ;;
  *"seg-$FAIL_SEGMENT."*) echo "simulated extraction error" >&2; exit 1 ;;
  *) echo segment > "$last" ;;
esac
)";

// Fake ffprobe listing keyframes every 2 seconds.
const char* FAKE_FFPROBE = R"(
printf '0.000000,K__\n1.000000,___\n2.000000,K__\n3.000000,___\n4.000000,K__\n'
)";

struct Fixture
{
  QTemporaryDir dir;
  MediaInfo media;
  ExportOptions options;
  QString output;

  Fixture()
  {
    require(dir.isValid(), "temporary directory");
    require(QDir(dir.path()).mkpath("work") && QDir(dir.path()).mkpath("out"), "directories");

    qunsetenv("FAIL_SEGMENT");
    qunsetenv("SLEEP");
    qunsetenv("CONCAT");

    options.tools.ffmpeg = writeScript(dir.filePath("ffmpeg"), FAKE_FFMPEG);
    options.tools.ffprobe = writeScript(dir.filePath("ffprobe"), FAKE_FFPROBE);
    options.temporaryDirectory = dir.filePath("work");
    options.copyPolicy = CopyPolicy::Reencode;

    media.filePath = dir.filePath("input.mp4");
    media.timeline = Timeline(10.0, {25, 1});

    output = dir.filePath("out/result.mp4");
  }

  QStringList entries(const QString& subdir) const
  {
    return QDir(dir.filePath(subdir))
        .entryList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot);
  }

  void writeOutput(const QByteArray& content) const
  {
    QFile file{output};
    require(file.open(QIODevice::WriteOnly | QIODevice::Truncate), "create destination");
    require(file.write(content) == content.size(), "write destination");
  }

  QByteArray readOutput() const
  {
    QFile file{output};
    require(file.open(QIODevice::ReadOnly), "destination readable");
    return file.readAll().trimmed();
  }

  QString log() const
  {
    QFile file{dir.filePath("ffmpeg.log")};
    if (!file.open(QIODevice::ReadOnly))
      return QString();
    return QString::fromUtf8(file.readAll());
  }
};

const std::vector<TimeSegment> THREE_SEGMENTS{
  TimeSegment(0, 2000),
  TimeSegment(4000, 6000),
  TimeSegment(8000, 10000),
};

void test_argument_builders()
{
  const QStringList copy = extractionArguments("in.mp4", 4.001, 6, "seg-1.mp4", true);
  require(copy.indexOf("-ss") >= 0 && copy.at(copy.indexOf("-ss") + 1) == "4.001000",
          "start time");
  require(copy.indexOf("-t") >= 0 && copy.at(copy.indexOf("-t") + 1) == "1.999000", "duration");
  require(copy.indexOf("-ss") < copy.indexOf("-i"), "input seeking");
  require(copy.contains("copy") && !copy.contains("libx264"), "stream copy");
  require(copy.last() == "seg-1.mp4", "output last");

  const QStringList reencode = extractionArguments("in.mp4", 4, 6, "seg-1.mp4", false);
  require(reencode.contains("libx264") && reencode.contains("aac"), "re-encoding");
  require(!reencode.contains("copy"), "no stream copy");

  const QStringList concat = concatenationArguments("list.txt", "out.mp4");
  require(concat.contains("concat") && concat.contains("list.txt"), "concat demuxer");
  require(concat.last() == "out.mp4", "concat output last");
}

void test_copy_policy_strings()
{
  bool ok = false;
  require(copyPolicyFromString("copy", &ok) == CopyPolicy::StreamCopy && ok, "copy");
  require(copyPolicyFromString(" Reencode ", &ok) == CopyPolicy::Reencode && ok, "reencode");
  require(copyPolicyFromString("auto", &ok) == CopyPolicy::Auto && ok, "auto");
  require(copyPolicyFromString("fast", &ok) == CopyPolicy::Auto && !ok, "unknown value");
  require(toString(CopyPolicy::StreamCopy) == "copy", "policy name");
}

void test_find_keyframe_start()
{
  const std::vector<double> keyframes{0, 2, 4.5};

  require(findKeyframeStart(TimeSegment(0, 1000), {}, 0.02) == 0.0, "start of file");
  require(findKeyframeStart(TimeSegment(2010, 3000), keyframes, 0.02) == 2.0,
          "keyframe before start");
  require(findKeyframeStart(TimeSegment(4490, 5000), keyframes, 0.02) == 4.5,
          "keyframe after start");
  require(!findKeyframeStart(TimeSegment(3000, 4000), keyframes, 0.02).has_value(),
          "no keyframe nearby");
}

void test_successful_export()
{
  Fixture f;

  ExportFailure failure;
  require(exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options, &failure),
          "export succeeds");
  require(failure.code == ErrorCode::NoError, "no failure");
  require(f.entries("out") == QStringList{"result.mp4"}, "only the destination is written");
  require(f.entries("work").isEmpty(), "temporary files removed");

  QFile result{f.output};
  require(result.open(QIODevice::ReadOnly), "destination readable");
  require(result.readAll().trimmed() == "concatenated", "destination written by concatenation");

  const QString log = f.log();
  require(log.count("libx264") == 3, "three re-encoded extractions");
  require(log.count("-f concat") == 1, "one concatenation");
}

void test_existing_destination_is_replaced()
{
  Fixture f;

  f.writeOutput("old");

  require(exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options), "export succeeds");

  require(f.readOutput() == "concatenated", "destination replaced");
  require(f.entries("out") == QStringList{"result.mp4"}, "no backup file left");
}

void test_extraction_failure()
{
  Fixture f;
  qputenv("FAIL_SEGMENT", "1");

  ExportFailure failure;
  require(!exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options, &failure),
          "export fails");
  require(failure.code == ErrorCode::ExternalToolError, "external tool error");
  require(failure.step == "extraction", "failing step");
  require(failure.segmentIndex == 1, "failing segment");
  require(failure.segment == THREE_SEGMENTS.at(1), "failing segment range");
  require(failure.diagnostics.contains("simulated extraction error"), "stderr captured");
  require(failure.toString().contains("segment 2"), "one-based segment in message");

  require(f.entries("out").isEmpty(), "no destination nor partial file");
  require(f.entries("work").isEmpty(), "temporary files removed");
  require(!f.log().contains("-f concat"), "concatenation not attempted");

  qunsetenv("FAIL_SEGMENT");
}

void test_concatenation_failure()
{
  Fixture f;
  f.writeOutput("old");
  qputenv("CONCAT", "fail");

  ExportFailure failure;
  require(!exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options, &failure),
          "export fails");
  require(failure.code == ErrorCode::ExternalToolError, "external tool error");
  require(failure.step == "concatenation", "failing step");
  require(failure.segmentIndex == -1, "no segment for concatenation");
  require(failure.diagnostics.contains("simulated concatenation error"), "stderr captured");

  require(f.readOutput() == "old", "destination untouched");
  require(f.entries("out") == QStringList{"result.mp4"}, "no partial file left");
  require(f.entries("work").isEmpty(), "temporary files removed");

  qunsetenv("CONCAT");
}

void test_destination_restored_when_rename_fails()
{
  Fixture f;
  f.writeOutput("old");
  qputenv("CONCAT", "nooutput");

  ExportFailure failure;
  require(!exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options, &failure),
          "export fails");
  require(failure.code == ErrorCode::ExternalToolError, "external tool error");
  require(failure.step == "concatenation", "failing step");

  require(f.readOutput() == "old", "destination restored");
  require(f.entries("out") == QStringList{"result.mp4"}, "no partial nor backup file left");
  require(f.entries("work").isEmpty(), "temporary files removed");

  qunsetenv("CONCAT");
}

void test_missing_tool()
{
  Fixture f;
  f.options.tools.ffmpeg = f.dir.filePath("does-not-exist");

  ExportFailure failure;
  require(!exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options, &failure),
          "export fails");
  require(failure.code == ErrorCode::ExternalToolError, "missing tool reported");
  require(f.entries("out").isEmpty(), "nothing written");
  require(f.entries("work").isEmpty(), "temporary files removed");
}

void test_nothing_to_export()
{
  Fixture f;

  ExportFailure failure;
  require(!exportTrimmed(f.media, {}, f.output, f.options, &failure), "export fails");
  require(failure.code == ErrorCode::EmptyResultError, "empty result");
}

void test_auto_policy_uses_keyframes()
{
  Fixture f;
  f.options.copyPolicy = CopyPolicy::Auto;

  TrimExporter exporter{f.media, {TimeSegment(0, 1000), TimeSegment(2000, 3000), TimeSegment(4000, 5000)}};
  exporter.setOutputFilePath(f.output);
  exporter.setOptions(f.options);

  require(exporter.run(), "export started");
  exporter.waitForFinished();

  require(exporter.state() == TrimExporter::State::Done, "export done");
  require(exporter.usesStreamCopy(), "segments aligned on keyframes are stream copied");

  const QString log = f.log();
  require(log.count("-c copy") == 3 && !log.contains("libx264"), "stream copy extractions");
  require(log.contains("-ss 2.001000"), "seek just after the keyframe");
}

void test_auto_policy_falls_back_to_reencode()
{
  Fixture f;
  f.options.copyPolicy = CopyPolicy::Auto;

  TrimExporter exporter{f.media, {TimeSegment(0, 1000), TimeSegment(3000, 4000)}};
  exporter.setOutputFilePath(f.output);
  exporter.setOptions(f.options);

  require(exporter.run(), "export started");
  exporter.waitForFinished();

  require(exporter.state() == TrimExporter::State::Done, "export done");
  require(!exporter.usesStreamCopy(), "unaligned segment forces re-encoding");
  require(f.log().count("libx264") == 2, "every segment re-encoded");
}

void test_timeout()
{
  Fixture f;
  qputenv("SLEEP", "5");
  f.options.timeout = 200;

  ExportFailure failure;
  require(!exportTrimmed(f.media, THREE_SEGMENTS, f.output, f.options, &failure),
          "export times out");
  require(failure.code == ErrorCode::Timeout, "timeout reported");
  require(f.entries("out").isEmpty(), "nothing written");
  require(f.entries("work").isEmpty(), "temporary files removed");

  qunsetenv("SLEEP");
}

void test_cancel()
{
  Fixture f;
  qputenv("SLEEP", "5");

  TrimExporter exporter{f.media, THREE_SEGMENTS};
  exporter.setOutputFilePath(f.output);
  exporter.setOptions(f.options);

  bool success = true;
  QObject::connect(&exporter, &TrimExporter::finished, [&success](bool ok) { success = ok; });

  require(exporter.run(), "export started");
  QTimer::singleShot(100, &exporter, &TrimExporter::cancel);
  exporter.waitForFinished();

  require(!success, "finished with failure");
  require(exporter.failure().code == ErrorCode::Canceled, "canceled");
  require(exporter.status().startsWith("Failed"), "failed status");
  require(f.entries("work").isEmpty(), "temporary files removed");

  qunsetenv("SLEEP");
}

} // namespace

int main(int argc, char* argv[])
{
  QCoreApplication app{argc, argv};

  test_argument_builders();
  test_copy_policy_strings();
  test_find_keyframe_start();
  test_successful_export();
  test_existing_destination_is_replaced();
  test_extraction_failure();
  test_concatenation_failure();
  test_destination_restored_when_rename_fails();
  test_missing_tool();
  test_nothing_to_export();
  test_auto_policy_uses_keyframes();
  test_auto_policy_falls_back_to_reencode();
  test_timeout();
  test_cancel();
  return 0;
}
