// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#include "appsettings.h"
#include "window.h"

#include <QApplication>
#include <QVersionNumber>

#include <QFileInfo>

int main(int argc, char *argv[])
{
  QApplication::setOrganizationName("Analogman Software");
  QApplication::setApplicationName("Snipper");
  QCoreApplication::setApplicationVersion(
      QVersionNumber(SNIPPER_VERSION_MAJOR, SNIPPER_VERSION_MINOR).toString());

  QApplication::setStyle("fusion");

  QApplication app{argc, argv};

  new AppSettings(&app);

  MainWindow window;
  window.show();

  if (app.arguments().size() > 1)
  {
    const QString path = app.arguments().at(1);
    if (QFileInfo::exists(path))
    {
      window.openFile(path);
    }
  }

  return app.exec();
}
