#include "window.h"

#include "appsettings.h"

#include "exporter.h"
#include "medialoader.h"
#include "session.h"

#include "cutlistwindow.h"
#include "videoplayerwidget.h"
#include "widgets/timelinewidget.h"

#include <QFileDialog>
#include <QMessageBox>
#include <QProgressDialog>

#include <QAction>
#include <QActionGroup>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>

#include <QLabel>
#include <QPushButton>

#include <QHBoxLayout>
#include <QVBoxLayout>

#include <QCloseEvent>

#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include <QApplication>
#include <QDebug>

constexpr const char* VIDEO_FILTER = "Videos (*.mp4 *.mkv *.mov *.avi *.webm);;All files (*)";

constexpr int STATUS_TIMEOUT = 4000;

static QString describe(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::InvalidRegion:
    return "Invalid cut: the end marker must be after the start marker.";
  case ErrorCode::OverlapError:
    return "Invalid cut: it overlaps an existing cut.";
  case ErrorCode::EmptyResultError:
    return "Nothing would be left of the video after removing the cuts.";
  default:
    return errorName(code);
  }
}

static QString describe(CopyPolicy policy)
{
  switch (policy)
  {
  case CopyPolicy::StreamCopy:
    return "Stream copy";
  case CopyPolicy::Reencode:
    return "Re-encode";
  case CopyPolicy::Auto:
  default:
    return "Stream copy when cuts are on keyframes";
  }
}

MainWindow::MainWindow()
{
  setWindowTitle("Snipper");

  m_settings = new QSettings(QSettings::IniFormat,
                             QSettings::UserScope,
                             "Analogman Software",
                             "snipper",
                             this);

  m_appSettings = AppSettings::getInstance(qApp);
  if (!m_appSettings)
  {
    m_appSettings = new AppSettings(this);
  }

  m_loader = new MediaLoader(this);
  connect(m_loader, &MediaLoader::progressChanged, this, &MainWindow::onLoadProgressChanged);
  connect(m_loader, &MediaLoader::loaded, this, &MainWindow::onMediaLoaded);
  connect(m_loader, &MediaLoader::failed, this, &MainWindow::onMediaLoadFailed);
  connect(m_loader, &MediaLoader::canceled, this, &MainWindow::onMediaLoadCanceled);

  if (QMenu* menu = menuBar()->addMenu("File"))
  {
    m_actions.openVideo = menu->addAction("Open video...",
                                          QKeySequence("Ctrl+O"),
                                          this,
                                          &MainWindow::actOpen);

    menu->addSeparator();

    m_actions.exportVideo = menu->addAction("Export...",
                                            QKeySequence("Ctrl+E"),
                                            this,
                                            &MainWindow::doExport);

    menu->addSeparator();
    menu->addAction("Quit", QKeySequence("Ctrl+Q"), this, &MainWindow::close);
  }

  if (QMenu* menu = menuBar()->addMenu("Edit"))
  {
    m_actions.placeMarker = menu->addAction("Place marker at playhead",
                                            QKeySequence("M"),
                                            this,
                                            &MainWindow::placeMarkerAtPlayhead);
    m_actions.removeLastMarker = menu->addAction("Remove last marker",
                                                 QKeySequence(Qt::Key_Escape),
                                                 this,
                                                 &MainWindow::removeLastMarker);
    m_actions.deleteRegion = menu->addAction("Delete cut at playhead",
                                             QKeySequence(QKeySequence::Delete),
                                             this,
                                             &MainWindow::deleteRegionAtPlayhead);

    menu->addSeparator();

    m_actions.clearMarkers = menu->addAction("Clear all cuts", this, &MainWindow::clearMarkers);
  }

  if (QMenu* menu = menuBar()->addMenu("Playback"))
  {
    m_actions.playPause = menu->addAction("Play/Pause", QKeySequence(Qt::Key_Space));
    m_actions.stepBackward = menu->addAction("Previous frame", QKeySequence(Qt::Key_Left));
    m_actions.stepForward = menu->addAction("Next frame", QKeySequence(Qt::Key_Right));
    m_actions.seekBackward = menu->addAction("Back one second",
                                             QKeySequence(Qt::SHIFT | Qt::Key_Left));
    m_actions.seekForward = menu->addAction("Forward one second",
                                            QKeySequence(Qt::SHIFT | Qt::Key_Right));
  }

  if (QMenu* menu = menuBar()->addMenu("View"))
  {
    m_actions.toggleCutListWindow = menu->addAction("Cut list",
                                                    this,
                                                    &MainWindow::toggleCutListPopup);
    m_actions.toggleCutListWindow->setCheckable(true);
  }

  if (QMenu* menu = menuBar()->addMenu("Settings"))
  {
    QMenu* submenu = menu->addMenu("Export mode");
    auto* group = new QActionGroup(this);

    for (CopyPolicy policy : {CopyPolicy::Auto, CopyPolicy::StreamCopy, CopyPolicy::Reencode})
    {
      QAction* action = submenu->addAction(describe(policy));
      action->setCheckable(true);
      action->setData(toString(policy));
      group->addAction(action);
    }

    connect(group, &QActionGroup::triggered, this, [this](QAction* action) {
      appSettings().setValue(EXPORT_COPY_POLICY_KEY, action->data());
    });

    auto check_policy = [group](const QVariant& value) {
      const CopyPolicy policy = copyPolicyFromString(value.toString());
      for (QAction* action : group->actions())
      {
        action->setChecked(action->data().toString() == toString(policy));
      }
    };

    check_policy(appSettings().value<QString>(EXPORT_COPY_POLICY_KEY, EXPORT_COPY_POLICY_DEFAULT));
    appSettings().watch(EXPORT_COPY_POLICY_KEY, group, check_policy);
  }

  if (QMenu* menu = menuBar()->addMenu("Help"))
  {
    menu->addAction("About", this, &MainWindow::about);
    menu->addAction("About Qt", qApp, &QApplication::aboutQt);
  }

  if (auto* central = new QWidget(this))
  {
    auto* layout = new QVBoxLayout(central);

    m_player = new VideoPlayerWidget;
    layout->addWidget(m_player, 1);

    m_timeline = new TimelineWidget;
    layout->addWidget(m_timeline);

    setCentralWidget(central);
  }

  connect(m_actions.playPause, &QAction::triggered, m_player, &VideoPlayerWidget::togglePlay);
  connect(m_actions.stepBackward, &QAction::triggered, m_player, &VideoPlayerWidget::stepBackward);
  connect(m_actions.stepForward, &QAction::triggered, m_player, &VideoPlayerWidget::stepForward);
  connect(m_actions.seekBackward, &QAction::triggered, m_player, &VideoPlayerWidget::seekBackward);
  connect(m_actions.seekForward, &QAction::triggered, m_player, &VideoPlayerWidget::seekForward);

  connect(m_player, &VideoPlayerWidget::positionChanged, m_timeline, &TimelineWidget::setPosition);
  connect(m_timeline, &TimelineWidget::clicked, this, &MainWindow::placeMarkerAt);

  m_cutListWindow = new CutListWindow(this);

  connect(m_cutListWindow,
          &CutListWindow::closed,
          this,
          &MainWindow::refreshUi,
          Qt::QueuedConnection);

  connect(m_cutListWindow,
          &CutListWindow::regionDoubleClicked,
          this,
          [this](const TimeSegment& region) { m_player->seek(region.start()); });

  statusBar()->showMessage("Open a video to start (Ctrl+O).");

  // restore window geometry
  {
    const auto geometry = settings().value(WINDOW_GEOMETRY_KEY, QByteArray()).toByteArray();
    if (!geometry.isEmpty())
      restoreGeometry(geometry);
  }

  refreshUi();
}

MainWindow::~MainWindow()
{
  disconnect(m_loader, nullptr, this, nullptr);
}

QSettings& MainWindow::settings() const
{
  return *m_settings;
}

AppSettings& MainWindow::appSettings() const
{
  return *m_appSettings;
}

QString MainWindow::getLastOpenDir() const
{
  return settings().value(LAST_OPEN_DIR_KEY, QString()).toString();
}

void MainWindow::updateLastOpenDir(const QString& path)
{
  QFileInfo info{path};
  if (info.isFile())
  {
    settings().setValue(LAST_OPEN_DIR_KEY, info.absolutePath());
  }
  else if (info.isDir())
  {
    settings().setValue(LAST_OPEN_DIR_KEY, path);
  }
}

void MainWindow::openFile(const QString& filePath)
{
  if (m_loader->isLoading())
  {
    QMessageBox::information(this, "Busy", "A video is already being loaded.");
    return;
  }

  m_loader->setTools(appSettings().tools());
  m_loader->setBucketCount(appSettings().waveformBuckets());

  if (!m_loader->load(filePath))
  {
    return;
  }

  m_loadProgress = new QProgressDialog(this);
  m_loadProgress->setWindowTitle("Loading");
  m_loadProgress->setLabelText("Loading " + QFileInfo(filePath).fileName() + "...");
  m_loadProgress->setRange(0, 100);
  m_loadProgress->setMinimumDuration(0);
  m_loadProgress->setAutoClose(false);
  m_loadProgress->setAutoReset(false);
  connect(m_loadProgress, &QProgressDialog::canceled, m_loader, &MediaLoader::cancel);
  m_loadProgress->show();

  refreshUi();
}

void MainWindow::about()
{
  if (!m_aboutDialog)
  {
    m_aboutDialog = new QDialog(this);
    m_aboutDialog->setWindowTitle("About | Snipper");

    auto* layout = new QVBoxLayout(m_aboutDialog);

    layout->addWidget(new QLabel(QString("This is Snipper v%1.\n\n"
                                         "Place pairs of markers on the timeline to cut\n"
                                         "regions out of a video, then export the result.")
                                     .arg(qApp->applicationVersion())));

    auto* btn = new QPushButton("Ok");
    connect(btn, &QPushButton::clicked, m_aboutDialog, &QDialog::close);
    layout->addWidget(btn, 0, Qt::AlignHCenter);
  }

  m_aboutDialog->show();
}

void MainWindow::actOpen()
{
  QString path = QFileDialog::getOpenFileName(this, "Open", getLastOpenDir(), VIDEO_FILTER);

  if (path.isEmpty())
  {
    return;
  }

  updateLastOpenDir(path);

  openFile(path);
}

void MainWindow::doExport()
{
  if (!m_session)
  {
    return;
  }

  std::vector<TimeSegment> segments;
  const ErrorCode err = m_session->planExport(segments);
  if (err != ErrorCode::NoError)
  {
    QMessageBox::warning(this, "Export", describe(err));
    return;
  }

  const QFileInfo source{m_session->filePath()};
  QString dir = settings().value(LAST_SAVE_DIR_KEY, QString()).toString();
  if (dir.isEmpty())
  {
    dir = source.absolutePath();
  }

  const QString suggestion = QDir(dir).filePath(source.completeBaseName() + "_trimmed."
                                                + source.suffix());

  const QString output_path = QFileDialog::getSaveFileName(this, "Export", suggestion, VIDEO_FILTER);

  if (output_path.isEmpty())
  {
    return;
  }

  if (QFileInfo(output_path).absoluteFilePath() == source.absoluteFilePath())
  {
    QMessageBox::warning(this, "Export", "The source video cannot be overwritten.");
    return;
  }

  updateLastSaveDir(output_path);

  QProgressDialog progress{this};
  progress.setWindowTitle("Export");
  progress.setModal(true);
  progress.setRange(0, 1000);
  progress.setLabelText("Exporting...");
  progress.setMinimumDuration(0);
  progress.setAutoClose(false);
  progress.setAutoReset(false);
  progress.show();

  m_actions.exportVideo->setEnabled(false);

  TrimExporter exporter{m_session->media(), segments};
  exporter.setOutputFilePath(output_path);
  exporter.setOptions(appSettings().exportOptions());

  connect(&exporter, &TrimExporter::progressChanged, this, [&exporter, &progress]() {
    progress.setValue(exporter.progress() * 1000);
  });
  connect(&exporter, &TrimExporter::statusChanged, this, [&exporter, &progress]() {
    progress.setLabelText(exporter.status());
  });
  connect(&progress, &QProgressDialog::canceled, &exporter, &TrimExporter::cancel);

  if (exporter.run())
  {
    exporter.waitForFinished();
  }

  progress.close();
  m_actions.exportVideo->setEnabled(true);

  if (exporter.state() == TrimExporter::State::Done)
  {
    showStatus("Exported " + QFileInfo(output_path).fileName());
  }
  else if (exporter.failure().code == ErrorCode::Canceled)
  {
    showStatus("Export canceled");
  }
  else
  {
    QMessageBox::critical(this, "Export failed", exporter.failure().toString());
  }
}

void MainWindow::toggleCutListPopup()
{
  m_cutListWindow->setVisible(!m_cutListWindow->isVisible());
  refreshUi();
}

void MainWindow::placeMarkerAtPlayhead()
{
  if (m_session)
  {
    placeMarkerAt(m_player->position());
  }
}

void MainWindow::placeMarkerAt(int64_t pos)
{
  if (!m_session)
  {
    return;
  }

  const ErrorCode err = m_session->placeMarker(pos);

  if (err != ErrorCode::NoError)
  {
    showStatus(describe(err));
    return;
  }

  m_player->seek(m_session->timeline().quantize(pos));

  const MarkerStore& markers = m_session->markers();
  if (markers.hasPendingMarker())
  {
    showStatus("Cut starts at "
               + Duration(*markers.pendingMarker()).toString(Duration::HHMMSSzzz)
               + ", place a second marker to end it.");
  }
  else
  {
    showStatus(QString("%1 cuts").arg(markers.regions().size()));
  }
}

void MainWindow::removeLastMarker()
{
  if (m_session && !m_session->markers().removeLastMarker())
  {
    showStatus("No marker to remove");
  }
}

void MainWindow::deleteRegionAtPlayhead()
{
  if (!m_session)
  {
    return;
  }

  if (!m_session->markers().removeRegionAt(m_player->position()))
  {
    showStatus("No cut at the playhead");
  }
}

void MainWindow::clearMarkers()
{
  if (!m_session || m_session->markers().empty())
  {
    return;
  }

  const int btn = QMessageBox::question(this,
                                        "Clear",
                                        "Remove all cuts?",
                                        QMessageBox::Ok | QMessageBox::Cancel,
                                        QMessageBox::Cancel);

  if (btn == QMessageBox::Ok)
  {
    m_session->markers().clear();
  }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
  if (m_session && !m_session->markers().empty())
  {
    int btn = QMessageBox::question(this,
                                    "Exit",
                                    "The cuts have not been exported and will be lost. Continue ?",
                                    QMessageBox::Ok | QMessageBox::Cancel,
                                    QMessageBox::Cancel);

    if (btn != QMessageBox::Ok)
    {
      event->setAccepted(false);
      return;
    }
  }

  m_loader->cancel();

  settings().setValue(WINDOW_GEOMETRY_KEY, saveGeometry());
  QMainWindow::closeEvent(event);
}

void MainWindow::refreshUi()
{
  const bool loaded = m_session != nullptr;

  m_actions.openVideo->setEnabled(!m_loader->isLoading());
  m_actions.exportVideo->setEnabled(loaded);
  m_actions.placeMarker->setEnabled(loaded);
  m_actions.removeLastMarker->setEnabled(loaded);
  m_actions.deleteRegion->setEnabled(loaded);
  m_actions.clearMarkers->setEnabled(loaded);
  m_actions.playPause->setEnabled(loaded);
  m_actions.stepForward->setEnabled(loaded);
  m_actions.stepBackward->setEnabled(loaded);
  m_actions.seekForward->setEnabled(loaded);
  m_actions.seekBackward->setEnabled(loaded);
  m_actions.toggleCutListWindow->setEnabled(loaded);
  m_actions.toggleCutListWindow->setChecked(m_cutListWindow && m_cutListWindow->isVisible());

  updateWindowTitle();
}

void MainWindow::updateWindowTitle()
{
  if (m_session)
  {
    QString title = m_session->media().title;
    if (title.isEmpty())
    {
      title = QFileInfo(m_session->filePath()).fileName();
    }

    title += " | Snipper";
    setWindowTitle(title);
  }
  else
  {
    setWindowTitle("Snipper");
  }
}

void MainWindow::onLoadProgressChanged(int percent, const QString& status)
{
  if (m_loadProgress)
  {
    m_loadProgress->setValue(percent);
    m_loadProgress->setLabelText(status);
  }

  statusBar()->showMessage(status);
}

void MainWindow::onMediaLoaded(const MediaLoadResult& result)
{
  closeLoadProgressDialog();

  setSession(new Session(result.media, result.peaks, this));

  const Timeline& timeline = result.media.timeline;
  showStatus(QString("Loaded %1 (%2, %3 fps)")
                 .arg(QFileInfo(result.media.filePath).fileName(),
                      Duration(timeline.durationMSecs()).toString(Duration::HHMMSSzzz),
                      QString::number(timeline.frameRate(), 'g', 4)));

  if (result.media.hasAudio && result.peaks.empty())
  {
    showStatus("Waveform unavailable");
  }
}

void MainWindow::onMediaLoadFailed(const QString& filePath, const QString& message)
{
  closeLoadProgressDialog();
  refreshUi();

  QMessageBox::critical(this,
                        "Error",
                        QString("Could not load %1:\n%2").arg(QFileInfo(filePath).fileName(), message));
}

void MainWindow::onMediaLoadCanceled(const QString& filePath)
{
  closeLoadProgressDialog();
  refreshUi();

  showStatus("Loading of " + QFileInfo(filePath).fileName() + " canceled");
}

void MainWindow::setSession(Session* session)
{
  Session* previous = m_session;
  m_session = session;

  m_player->setSession(m_session);
  m_timeline->setSession(m_session);
  m_cutListWindow->setSession(m_session);

  if (m_session)
  {
    connect(&m_session->markers(), &MarkerStore::changed, this, &MainWindow::refreshUi);
  }

  if (previous)
  {
    previous->deleteLater();
  }

  refreshUi();
}

void MainWindow::closeLoadProgressDialog()
{
  if (m_loadProgress)
  {
    disconnect(m_loadProgress, nullptr, m_loader, nullptr);
    m_loadProgress->close();
    m_loadProgress->deleteLater();
    m_loadProgress = nullptr;
  }
}

void MainWindow::updateLastSaveDir(const QString& filePath)
{
  if (!filePath.isEmpty())
  {
    settings().setValue(LAST_SAVE_DIR_KEY, QFileInfo(filePath).absolutePath());
  }
}

void MainWindow::showStatus(const QString& message)
{
  statusBar()->showMessage(message, STATUS_TIMEOUT);
}
