// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include "timesegment.h"

#include <QWidget>

class QLabel;
class QTreeWidget;
class QTreeWidgetItem;

class Session;

// Tool window listing the cut regions of a session.
class CutListWindow : public QWidget
{
  Q_OBJECT
public:
  explicit CutListWindow(QWidget* parent = nullptr);
  ~CutListWindow();

  Session* session() const;
  void setSession(Session* session);

Q_SIGNALS:
  void closed();
  void regionDoubleClicked(const TimeSegment& region);

protected Q_SLOTS:
  void onItemDoubleClicked(QTreeWidgetItem* item);
  void resetRegionList();

protected:
  bool eventFilter(QObject* watched, QEvent* event) override;

  void closeEvent(QCloseEvent* ev) override;

private:
  void fill(QTreeWidgetItem* item, const TimeSegment& region);
  void updateSummary();

private:
  Session* m_session = nullptr;
  QTreeWidget* m_regionListWidget;
  QLabel* m_summaryLabel;
};
