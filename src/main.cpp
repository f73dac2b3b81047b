#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "waveview/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("WaveView"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("waveview.local"));
    QCoreApplication::setApplicationName(QStringLiteral("WaveView"));

    QApplication app(argc, argv);

    waveview::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("WaveView %1").arg(QString::fromLatin1(kWaveViewVersion)));
    mainWindow.show();

    return app.exec();
}
