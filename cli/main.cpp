// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#include "exporter.h"
#include "exportplanner.h"
#include "medialoader.h"
#include "mediaprobe.h"
#include "session.h"

#include <QCoreApplication>

#include <QFileInfo>
#include <QTextStream>

#include <QVersionNumber>

#include <iostream>

static bool helpRequested(const QStringList& args)
{
  return args.contains("-h") || args.contains("--help") || args.contains("-?");
}

// options shared by the commands that run external tools
static bool parseToolOption(const QStringList& args, int& i, ExternalTools& tools)
{
  const QString& a = args.at(i - 1);

  if (a == "--ffmpeg" && i < args.size())
  {
    tools.ffmpeg = args.at(i++);
    return true;
  }
  else if (a == "--ffprobe" && i < args.size())
  {
    tools.ffprobe = args.at(i++);
    return true;
  }

  return false;
}

static bool probe(QTextStream& cerr,
                  const QString& filePath,
                  const ExternalTools& tools,
                  MediaInfo& media)
{
  try
  {
    media = probeMedia(filePath, tools);
    return true;
  }
  catch (const LoadError& ex)
  {
    cerr << "Error: " << ex.what() << Qt::endl;
    return false;
  }
}

namespace PlanCommand {

struct Inputs
{
  QString videoFilePath;
  QStringList cuts;
  ExternalTools tools;
};

// Inserts the cuts through a session so that they are snapped to frames
// and validated the same way as in the editor.
bool applyCuts(QTextStream& cerr, Session& session, const QStringList& cuts)
{
  for (const QString& text : cuts)
  {
    bool ok = false;
    const TimeSegment cut = TimeSegment::fromString(text, &ok);

    if (!ok)
    {
      cerr << "Error: invalid cut '" << text << "', expected start-end." << Qt::endl;
      return false;
    }

    ErrorCode err = session.placeMarker(cut.start());
    if (err == ErrorCode::NoError)
    {
      err = session.placeMarker(cut.end());
    }

    if (err != ErrorCode::NoError)
    {
      cerr << "Error: cut " << text << " rejected (" << errorName(err) << ")." << Qt::endl;
      return false;
    }
  }

  return true;
}

void printSegments(QTextStream& out, const std::vector<TimeSegment>& segments)
{
  for (size_t i(0); i < segments.size(); ++i)
  {
    const TimeSegment& seg = segments.at(i);
    out << (i + 1) << ": " << seg.toString() << " ("
        << Duration(seg.duration()).toString(Duration::Seconds) << "s)" << Qt::endl;
  }

  out << "total: " << Duration(totalDuration(segments)).toString(Duration::HHMMSSzzz) << Qt::endl;
}

} // namespace PlanCommand

int cmd_probe(QStringList args)
{
  QTextStream cout{stdout};
  QTextStream cerr{stderr};

  if (helpRequested(args) || args.isEmpty())
  {
    cout << "snipper-cli probe [--keyframes] [--ffprobe path] video.mp4" << Qt::endl;
    return 0;
  }

  ExternalTools tools;
  QString inputpath;
  bool show_keyframes = false;

  for (int i(0); i < args.size();)
  {
    const QString& a = args.at(i++);
    if (a == "--keyframes")
    {
      show_keyframes = true;
    }
    else if (a.startsWith("-"))
    {
      if (!parseToolOption(args, i, tools))
      {
        cerr << "Unknown option: " << a << "." << Qt::endl;
        return 1;
      }
    }
    else
    {
      inputpath = a;
    }
  }

  MediaInfo media;
  if (!probe(cerr, inputpath, tools, media))
  {
    return 1;
  }

  const Timeline& timeline = media.timeline;

  cout << "file: " << media.filePath << Qt::endl;
  if (!media.title.isEmpty())
  {
    cout << "title: " << media.title << Qt::endl;
  }
  cout << "duration: " << Duration(timeline.durationMSecs()).toString(Duration::HHMMSSzzz)
       << Qt::endl;
  cout << "frame rate: " << timeline.frameRateAsRational().first << "/"
       << timeline.frameRateAsRational().second << " (" << timeline.frameRate() << " fps)"
       << Qt::endl;
  cout << "audio: " << (media.hasAudio ? "yes" : "no") << Qt::endl;

  if (show_keyframes)
  {
    std::vector<double> keyframes;
    QString errors;
    if (!probeKeyframes(media.filePath, tools, keyframes, &errors))
    {
      cerr << "Error: could not list keyframes: " << errors.trimmed() << Qt::endl;
      return 1;
    }

    cout << "keyframes:";
    for (double k : keyframes)
    {
      cout << " " << Duration::fromSeconds(k).toString(Duration::Seconds);
    }
    cout << Qt::endl;
  }

  return 0;
}

static bool parsePlanInputs(QTextStream& cerr,
                            const QStringList& args,
                            PlanCommand::Inputs& inputs,
                            ExportOptions* options,
                            QString* outputpath)
{
  for (int i(0); i < args.size();)
  {
    const QString& a = args.at(i++);
    const bool has_value = i < args.size();

    if ((a == "--input" || a == "-i") && has_value)
    {
      inputs.videoFilePath = args.at(i++);
    }
    else if ((a == "--cut" || a == "-c") && has_value)
    {
      inputs.cuts.push_back(args.at(i++));
    }
    else if (parseToolOption(args, i, inputs.tools))
    {
      continue;
    }
    else if (options && outputpath && (a == "--output" || a == "-o") && has_value)
    {
      *outputpath = args.at(i++);
    }
    else if (options && a == "--copy")
    {
      options->copyPolicy = CopyPolicy::StreamCopy;
    }
    else if (options && a == "--reencode")
    {
      options->copyPolicy = CopyPolicy::Reencode;
    }
    else if (options && a == "--jobs" && has_value)
    {
      bool ok = false;
      options->maxParallelJobs = args.at(i++).toInt(&ok);
      if (!ok || options->maxParallelJobs < 1)
      {
        cerr << "Invalid number of jobs." << Qt::endl;
        return false;
      }
    }
    else
    {
      cerr << "Unknown option: " << a << "." << Qt::endl;
      return false;
    }
  }

  if (inputs.videoFilePath.isEmpty())
  {
    cerr << "An input video must be specified." << Qt::endl;
    return false;
  }

  return true;
}

int cmd_plan(QStringList args)
{
  QTextStream cout{stdout};
  QTextStream cerr{stderr};

  if (helpRequested(args) || args.isEmpty())
  {
    cout << "snipper-cli plan -i video.mp4 -c 0:10-0:20 [-c ...]" << Qt::endl;
    return 0;
  }

  PlanCommand::Inputs inputs;
  if (!parsePlanInputs(cerr, args, inputs, nullptr, nullptr))
  {
    return 1;
  }

  MediaInfo media;
  if (!probe(cerr, inputs.videoFilePath, inputs.tools, media))
  {
    return 1;
  }

  Session session{media, WaveformPeaks()};

  if (!PlanCommand::applyCuts(cerr, session, inputs.cuts))
  {
    return 1;
  }

  std::vector<TimeSegment> segments;
  const ErrorCode err = session.planExport(segments);
  if (err != ErrorCode::NoError)
  {
    cerr << "Error: " << errorName(err) << Qt::endl;
    return 1;
  }

  PlanCommand::printSegments(cout, segments);

  return 0;
}

int cmd_export(QStringList args)
{
  QTextStream cout{stdout};
  QTextStream cerr{stderr};

  if (helpRequested(args) || args.isEmpty())
  {
    cout << "snipper-cli export -i video.mp4 -c 0:10-0:20 [-c ...] -o out.mp4 [--copy|--reencode] "
            "[--jobs N]"
         << Qt::endl;
    return 0;
  }

  PlanCommand::Inputs inputs;
  ExportOptions options;
  QString outputpath;

  if (!parsePlanInputs(cerr, args, inputs, &options, &outputpath))
  {
    return 1;
  }

  if (outputpath.isEmpty())
  {
    cerr << "An output file must be specified." << Qt::endl;
    return 1;
  }

  options.tools = inputs.tools;

  MediaInfo media;
  if (!probe(cerr, inputs.videoFilePath, inputs.tools, media))
  {
    return 1;
  }

  Session session{media, WaveformPeaks()};

  if (!PlanCommand::applyCuts(cerr, session, inputs.cuts))
  {
    return 1;
  }

  std::vector<TimeSegment> segments;
  const ErrorCode err = session.planExport(segments);
  if (err != ErrorCode::NoError)
  {
    cerr << "Error: " << errorName(err) << Qt::endl;
    return 1;
  }

  cerr << "Exporting " << segments.size() << " segments to " << outputpath << "..." << Qt::endl;

  ExportFailure failure;
  if (!exportTrimmed(media, segments, outputpath, options, &failure))
  {
    cerr << "Error: " << failure.toString() << Qt::endl;
    return 1;
  }

  cout << QFileInfo(outputpath).absoluteFilePath() << Qt::endl;

  return 0;
}

int cmd_peaks(QStringList args)
{
  QTextStream cout{stdout};
  QTextStream cerr{stderr};

  if (helpRequested(args) || args.isEmpty())
  {
    cout << "snipper-cli peaks [--buckets N] video.mp4" << Qt::endl;
    return 0;
  }

  ExternalTools tools;
  QString inputpath;
  int buckets = 100;

  for (int i(0); i < args.size();)
  {
    const QString& a = args.at(i++);
    if (a == "--buckets" && i < args.size())
    {
      bool ok = false;
      buckets = args.at(i++).toInt(&ok);
      if (!ok || buckets < 1)
      {
        cerr << "Invalid number of buckets." << Qt::endl;
        return 1;
      }
    }
    else if (a.startsWith("-"))
    {
      if (!parseToolOption(args, i, tools))
      {
        cerr << "Unknown option: " << a << "." << Qt::endl;
        return 1;
      }
    }
    else
    {
      inputpath = a;
    }
  }

  MediaLoader loader;
  loader.setTools(tools);
  loader.setBucketCount(buckets);

  bool success = false;

  QObject::connect(&loader, &MediaLoader::progressChanged, [&cerr](int percent, const QString& status) {
    cerr << percent << "% " << status << Qt::endl;
  });

  QObject::connect(&loader, &MediaLoader::loaded, [&](const MediaLoadResult& result) {
    success = true;
    for (const WavePeak& peak : result.peaks)
    {
      cout << peak.min << " " << peak.max << "\n";
    }
    cout.flush();
  });

  QObject::connect(&loader, &MediaLoader::failed, [&cerr](const QString&, const QString& message) {
    cerr << "Error: " << message << Qt::endl;
  });

  loader.load(inputpath);
  loader.waitForFinished();

  return success ? 0 : 1;
}

int main(int argc, char* argv[])
{
  QCoreApplication::setOrganizationName("Analogman Software");
  QCoreApplication::setApplicationName("Snipper");
  QCoreApplication::setApplicationVersion(
      QVersionNumber(SNIPPER_VERSION_MAJOR, SNIPPER_VERSION_MINOR).toString());

  QCoreApplication app{argc, argv};

  const QStringList args = app.arguments();

  if (args.size() > 1)
  {
    if (args.at(1) == "probe")
    {
      return cmd_probe(args.mid(2));
    }
    else if (args.at(1) == "plan")
    {
      return cmd_plan(args.mid(2));
    }
    else if (args.at(1) == "export")
    {
      return cmd_export(args.mid(2));
    }
    else if (args.at(1) == "peaks")
    {
      return cmd_peaks(args.mid(2));
    }
    else if (!args.at(1).startsWith("-"))
    {
      std::cerr << "Unknown command " << args.at(1).toStdString() << std::endl;
      return 1;
    }
  }

  if (helpRequested(args) || args.size() <= 1)
  {
    QTextStream cout{stdout};
    cout << "snipper-cli <command> [arguments..]" << Qt::endl;
    cout << Qt::endl;
    cout << "Available commands:" << Qt::endl;
    cout << "  probe     print information about a video" << Qt::endl;
    cout << "  plan      print the segments kept after removing cuts" << Qt::endl;
    cout << "  export    write a video without the cut regions" << Qt::endl;
    cout << "  peaks     print the waveform peaks of a video" << Qt::endl;
    cout << Qt::endl;
    cout << "Get more information about a command using: snipper-cli <command> --help" << Qt::endl;
  }
  else if (args.contains("-v") || args.contains("--version"))
  {
    std::cout << app.applicationVersion().toStdString() << std::endl;
  }

  return 0;
}
