#include "videoplayerwidget.h"

#include "widgets/playerbar.h"

#include "session.h"

#include <QAudioOutput>
#include <QMediaPlayer>
#include <QVideoWidget>

#include <QStyle>
#include <QToolButton>

#include <QVBoxLayout>

#include <QDebug>

#include <algorithm>
#include <cmath>

static QToolButton* createButton(QWidget* parent, QStyle::StandardPixmap icon, const QString& tip)
{
  auto* button = new QToolButton(parent);
  button->setIcon(parent->style()->standardIcon(icon));
  button->setToolTip(tip);
  button->setAutoRaise(true);
  button->setFocusPolicy(Qt::NoFocus);
  return button;
}

VideoPlayerWidget::VideoPlayerWidget()
{
  m_player = new QMediaPlayer(this);

  m_video_widget = new QVideoWidget;
  m_video_widget->setMinimumSize(400, 260);
  m_player->setVideoOutput(m_video_widget);

  m_audio_output = new QAudioOutput(this);
  m_player->setAudioOutput(m_audio_output);

  if (auto* l = new QVBoxLayout(this))
  {
    l->setSpacing(0);
    l->addWidget(m_video_widget, 2);

    l->addSpacing(6);

    m_playerBar = new PlayerBar;
    m_playerBar->setEnabled(false);
    l->addWidget(m_playerBar);

    l->addSpacing(2);

    if (auto* row = new QHBoxLayout)
    {
      if (auto* btnsrow = new QHBoxLayout)
      {
        btnsrow->setContentsMargins(QMargins());
        btnsrow->setSpacing(6);
        m_play_button = createButton(this, QStyle::SP_MediaPlay, "Play/Pause (Space)");
        m_stop_button = createButton(this, QStyle::SP_MediaStop, "Stop");
        m_stepBackwardButton = createButton(this, QStyle::SP_MediaSeekBackward, "Previous frame");
        m_stepForwardButton = createButton(this, QStyle::SP_MediaSeekForward, "Next frame");

        btnsrow->addWidget(m_play_button, 0, Qt::AlignVCenter);
        btnsrow->addWidget(m_stop_button, 0, Qt::AlignVCenter);
        btnsrow->addWidget(m_stepBackwardButton, 0, Qt::AlignVCenter);
        btnsrow->addWidget(m_stepForwardButton, 0, Qt::AlignVCenter);

        row->addLayout(btnsrow);
      }

      row->addStretch();

      m_timeDisplay = new TimeDisplay(this);
      row->addWidget(m_timeDisplay, 0, Qt::AlignVCenter);

      l->addLayout(row);
    }
  }

  // connect player bar
  {
    connect(m_player,
            &QMediaPlayer::positionChanged,
            this,
            &VideoPlayerWidget::onMediaPlayerPositionChanged);
    connect(m_playerBar, &PlayerBar::clicked, this, &VideoPlayerWidget::seekTime);
  }

  // connect buttons
  {
    connect(m_play_button, &QToolButton::clicked, this, &VideoPlayerWidget::togglePlay);
    connect(m_stop_button, &QToolButton::clicked, this, &VideoPlayerWidget::stop);
    connect(m_stepBackwardButton, &QToolButton::clicked, this, &VideoPlayerWidget::stepBackward);
    connect(m_stepForwardButton, &QToolButton::clicked, this, &VideoPlayerWidget::stepForward);
  }

  // other connections
  {
    connect(m_player,
            &QMediaPlayer::playbackStateChanged,
            this,
            &VideoPlayerWidget::onPlaybackStateChanged);
    connect(m_player, &QMediaPlayer::errorOccurred, this, [this]() {
      qWarning() << "media player error:" << m_player->errorString();
    });
  }

  setEnabled(false);
}

VideoPlayerWidget::~VideoPlayerWidget() {}

Session* VideoPlayerWidget::session() const
{
  return m_session;
}

void VideoPlayerWidget::setSession(Session* session)
{
  if (m_session == session)
  {
    return;
  }

  if (m_session)
  {
    disconnect(&m_session->markers(), nullptr, this, nullptr);
  }

  m_session = session;
  m_player->stop();

  if (m_session)
  {
    m_player->setSource(QUrl::fromLocalFile(m_session->filePath()));
    m_playerBar->setEnabled(true);

    m_playerBar->setRange(0, m_session->timeline().duration());
    m_timeDisplay->setMax(m_session->timeline().durationMSecs());

    connect(&m_session->markers(),
            &MarkerStore::changed,
            this,
            &VideoPlayerWidget::onRegionsChanged);
  }
  else
  {
    m_player->setSource(QUrl());
    m_playerBar->setRange(0, 1);
    m_timeDisplay->setMax(0);
    m_playerBar->setEnabled(false);
  }

  onRegionsChanged();
  setEnabled(m_session != nullptr);
}

QMediaPlayer* VideoPlayerWidget::player() const
{
  return m_player;
}

int64_t VideoPlayerWidget::position() const
{
  return m_player->position();
}

void VideoPlayerWidget::play()
{
  m_player->play();
}

void VideoPlayerWidget::pause()
{
  m_player->pause();
}

void VideoPlayerWidget::stop()
{
  m_player->stop();
}

void VideoPlayerWidget::togglePlay()
{
  if (m_player->isPlaying())
  {
    pause();
  }
  else
  {
    play();
  }
}

void VideoPlayerWidget::stepForward()
{
  if (!m_session)
  {
    return;
  }

  pause();
  const double delta = m_session->timeline().frameDelta();
  seek(m_session->timeline().quantize(position() + std::llround(delta * 1000)));
}

void VideoPlayerWidget::stepBackward()
{
  if (!m_session)
  {
    return;
  }

  pause();
  const double delta = m_session->timeline().frameDelta();
  seek(m_session->timeline().quantize(position() - std::llround(delta * 1000)));
}

void VideoPlayerWidget::seekForward()
{
  seek(position() + 1000);
}

void VideoPlayerWidget::seekBackward()
{
  seek(position() - 1000);
}

void VideoPlayerWidget::seekTime(double val)
{
  seek(std::llround(val * 1000));
}

void VideoPlayerWidget::seek(int64_t val)
{
  if (m_session)
  {
    val = std::clamp<int64_t>(val, 0, m_session->timeline().durationMSecs());
  }

  m_player->setPosition(val);
}

void VideoPlayerWidget::onMediaPlayerPositionChanged(qint64 pos)
{
  m_playerBar->setValue(pos / double(1000));
  m_timeDisplay->setCurrent(pos);
  Q_EMIT positionChanged(pos);
}

void VideoPlayerWidget::onPlaybackStateChanged()
{
  const bool playing = m_player->playbackState() == QMediaPlayer::PlayingState;
  m_play_button->setIcon(style()->standardIcon(playing ? QStyle::SP_MediaPause
                                                       : QStyle::SP_MediaPlay));
}

void VideoPlayerWidget::onRegionsChanged()
{
  if (m_session)
  {
    m_playerBar->setRegions(m_session->markers().regions());
  }
  else
  {
    m_playerBar->setRegions({});
  }
}
