#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "agenda/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("AgendaDemo"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("agenda-demo.local"));
    QCoreApplication::setApplicationName(QStringLiteral("Agenda"));

    QApplication app(argc, argv);

    agenda::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("Agenda %1").arg(QString::fromLatin1(kAgendaVersion)));
    mainWindow.resize(420, 720);
    mainWindow.show();

    return app.exec();
}
