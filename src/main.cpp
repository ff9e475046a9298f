#include <QStyleFactory>
#include <QPalette>
#include <QSettings>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include "MainWindow.h"
#include "core/ViewerApplication.h"
#include "core/ViewerConfig.h"
#include "core/Logger.h"
#include "core/Version.h"

int main(int argc, char *argv[])
{
    ViewerApplication app(argc, argv);
    QCoreApplication::setOrganizationName("ImView");
    QCoreApplication::setApplicationName("ImView");
    QCoreApplication::setApplicationVersion(ImView::getVersion());

    const QString appDir = QCoreApplication::applicationDirPath();
    QSettings settings("ImView", "ImView");
    ViewerConfig config = ViewerConfig::fromSettings(settings, appDir);

    QTextStream err(stderr);
    QString argError;
    if (!ViewerConfig::applyArguments(config, QCoreApplication::arguments(), &argError)) {
        err << argError << Qt::endl;
        return 1;
    }

    Logger::init(config.logDir);
    Logger::info(QString("ImView %1 starting").arg(ImView::getVersion()), "Main");

    // Dark Fusion theme
    QApplication::setStyle(QStyleFactory::create("Fusion"));
    QPalette p = qApp->palette();
    p.setColor(QPalette::Window, QColor(53, 53, 53));
    p.setColor(QPalette::WindowText, Qt::white);
    p.setColor(QPalette::Base, QColor(25, 25, 25));
    p.setColor(QPalette::AlternateBase, QColor(53, 53, 53));
    p.setColor(QPalette::Text, Qt::white);
    p.setColor(QPalette::Button, QColor(53, 53, 53));
    p.setColor(QPalette::ButtonText, Qt::white);
    p.setColor(QPalette::Highlight, QColor(42, 130, 218));
    p.setColor(QPalette::HighlightedText, Qt::black);
    qApp->setPalette(p);

    MainWindow window(config);

    // The decode diagnostic itself is echoed to stderr by the logger
    if (!window.openImage(config.imagePath)) {
        err << "imview: cannot open " << QDir::toNativeSeparators(config.imagePath) << Qt::endl;
        Logger::shutdown();
        return 1;
    }

    window.show();
    const int rc = app.exec();

    Logger::info("Shutting down", "Main");
    Logger::shutdown();
    return rc;
}
