#include "cutlistwindow.h"

#include "exportplanner.h"
#include "session.h"

#include <QLabel>
#include <QTreeWidget>
#include <QTreeWidgetItem>

#include <QVBoxLayout>

#include <QStringList>
#include <QVariant>

#include <QKeyEvent>

CutListWindow::CutListWindow(QWidget* parent)
    : QWidget(parent, Qt::Tool)
{
  setWindowTitle("Cut list");

  if (auto* layout = new QVBoxLayout(this))
  {
    layout->addWidget(m_regionListWidget = new QTreeWidget(this));
    m_regionListWidget->setContextMenuPolicy(Qt::NoContextMenu);

    m_regionListWidget->setColumnCount(3);
    m_regionListWidget->setHeaderLabels(QStringList() << "Start"
                                                      << "End"
                                                      << "Duration");
    m_regionListWidget->setIndentation(0);

    m_regionListWidget->installEventFilter(this);

    layout->addWidget(m_summaryLabel = new QLabel(this));
  }

  connect(m_regionListWidget,
          &QTreeWidget::itemDoubleClicked,
          this,
          &CutListWindow::onItemDoubleClicked);

  resetRegionList();
}

CutListWindow::~CutListWindow() {}

Session* CutListWindow::session() const
{
  return m_session;
}

void CutListWindow::setSession(Session* session)
{
  if (m_session)
  {
    disconnect(&m_session->markers(), nullptr, this, nullptr);
  }

  m_session = session;

  if (m_session)
  {
    connect(&m_session->markers(), &MarkerStore::changed, this, &CutListWindow::resetRegionList);
  }

  resetRegionList();
}

static TimeSegment getRegion(const QTreeWidgetItem* item)
{
  const QVariant data = item->data(0, Qt::UserRole);
  const QList<QVariant> bounds = data.toList();

  if (bounds.size() != 2)
  {
    return TimeSegment();
  }

  return TimeSegment(bounds.front().toLongLong(), bounds.back().toLongLong());
}

void CutListWindow::onItemDoubleClicked(QTreeWidgetItem* item)
{
  if (item)
  {
    Q_EMIT regionDoubleClicked(getRegion(item));
  }
}

void CutListWindow::resetRegionList()
{
  m_regionListWidget->clear();

  if (m_session)
  {
    for (const TimeSegment& region : m_session->markers().regions())
    {
      auto* item = new QTreeWidgetItem;
      fill(item, region);
      m_regionListWidget->addTopLevelItem(item);
    }
  }

  updateSummary();
}

bool CutListWindow::eventFilter(QObject* watched, QEvent* event)
{
  if (watched != m_regionListWidget || !m_session)
  {
    return false;
  }

  if (event->type() == QEvent::KeyPress)
  {
    auto* kev = static_cast<QKeyEvent*>(event);
    QTreeWidgetItem* item = m_regionListWidget->currentItem();

    if (kev->key() == Qt::Key_Delete && item)
    {
      m_session->markers().removeRegion(getRegion(item));
      return true;
    }
  }

  return false;
}

void CutListWindow::closeEvent(QCloseEvent* ev)
{
  QWidget::closeEvent(ev);
  Q_EMIT closed();
}

void CutListWindow::fill(QTreeWidgetItem* item, const TimeSegment& region)
{
  item->setFlags(item->flags() | Qt::ItemNeverHasChildren);
  item->setData(0,
                Qt::UserRole,
                QVariantList() << qlonglong(region.start()) << qlonglong(region.end()));

  item->setData(0, Qt::DisplayRole, Duration(region.start()).toString(Duration::HHMMSSzzz));
  item->setData(1, Qt::DisplayRole, Duration(region.end()).toString(Duration::HHMMSSzzz));
  item->setData(2, Qt::DisplayRole, Duration(region.duration()).toString(Duration::Seconds));
}

void CutListWindow::updateSummary()
{
  if (!m_session)
  {
    m_summaryLabel->clear();
    return;
  }

  const std::vector<TimeSegment>& regions = m_session->markers().regions();
  const int64_t cut = totalDuration(regions);
  const int64_t remaining = m_session->timeline().durationMSecs() - cut;

  m_summaryLabel->setText(QString("%1 cuts, %2 removed, %3 remaining")
                              .arg(regions.size())
                              .arg(Duration(cut).toString(Duration::HHMMSSzzz))
                              .arg(Duration(remaining).toString(Duration::HHMMSSzzz)));
}
