#include "ViewerConfig.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QRegularExpression>
#include <QSettings>

QString ViewerConfig::defaultImagePath(const QString& appDir) {
    return QDir::cleanPath(QDir(appDir).absoluteFilePath("../out/latest.ppm"));
}

ViewerConfig ViewerConfig::fromSettings(const QSettings& settings, const QString& appDir) {
    ViewerConfig c;
    QDir dir(appDir);

    c.imagePath = defaultImagePath(appDir);
    c.windowTitle = settings.value("window/title", c.windowTitle).toString();
    c.windowSize = QSize(settings.value("window/width", c.windowSize.width()).toInt(),
                         settings.value("window/height", c.windowSize.height()).toInt());
    c.iconPath = settings.value("window/icon", dir.filePath("icon.ico")).toString();
    c.histogramBins = settings.value("histogram/bins", c.histogramBins).toInt();
    c.isolineInitial = settings.value("isoline/initial", c.isolineInitial).toDouble();
    c.watchEnabled = settings.value("watch/enabled", c.watchEnabled).toBool();
    c.debounceMs = settings.value("watch/debounceMs", c.debounceMs).toInt();
    c.pollMs = settings.value("watch/pollMs", c.pollMs).toInt();
    c.keepPinnedLevelsOnReload = settings.value("levels/keepPinnedOnReload", c.keepPinnedLevelsOnReload).toBool();
    c.logDir = settings.value("log/dir", dir.filePath("logs")).toString();

    if (c.windowSize.width() <= 0 || c.windowSize.height() <= 0) c.windowSize = QSize(800, 450);
    if (c.histogramBins <= 0) c.histogramBins = 256;
    if (c.debounceMs < 0) c.debounceMs = 50;
    if (c.pollMs <= 0) c.pollMs = 250;
    return c;
}

bool ViewerConfig::applyArguments(ViewerConfig& config, const QStringList& arguments, QString* errorMsg) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Live-reloading image inspection viewer"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("file", QCoreApplication::translate("main", "Image to display (default: ../out/latest.ppm)"));

    QCommandLineOption sizeOpt("size", QCoreApplication::translate("main", "Initial window size."), "WxH");
    QCommandLineOption binsOpt("bins", QCoreApplication::translate("main", "Histogram bin count."), "N");
    QCommandLineOption isoOpt("isoline", QCoreApplication::translate("main", "Initial isoline value."), "V");
    QCommandLineOption noWatchOpt("no-watch", QCoreApplication::translate("main", "Do not reload when the file changes."));
    QCommandLineOption resetOpt("reset-levels", QCoreApplication::translate("main", "Recompute levels on every reload, even after manual adjustment."));
    QCommandLineOption logOpt("log-dir", QCoreApplication::translate("main", "Directory for the log file."), "DIR");
    parser.addOptions({sizeOpt, binsOpt, isoOpt, noWatchOpt, resetOpt, logOpt});

    if (!parser.parse(arguments)) {
        if (errorMsg) *errorMsg = parser.errorText();
        return false;
    }
    if (parser.isSet("help")) parser.showHelp(0);
    if (parser.isSet("version")) parser.showVersion();

    if (!parser.positionalArguments().isEmpty()) {
        config.imagePath = parser.positionalArguments().first();
    }

    if (parser.isSet(sizeOpt)) {
        static const QRegularExpression re("^(\\d+)[xX](\\d+)$");
        const QRegularExpressionMatch m = re.match(parser.value(sizeOpt));
        if (!m.hasMatch() || m.captured(1).toInt() <= 0 || m.captured(2).toInt() <= 0) {
            if (errorMsg) *errorMsg = QString("Invalid --size '%1', expected WxH").arg(parser.value(sizeOpt));
            return false;
        }
        config.windowSize = QSize(m.captured(1).toInt(), m.captured(2).toInt());
    }

    if (parser.isSet(binsOpt)) {
        bool ok = false;
        const int bins = parser.value(binsOpt).toInt(&ok);
        if (!ok || bins <= 0) {
            if (errorMsg) *errorMsg = QString("Invalid --bins '%1'").arg(parser.value(binsOpt));
            return false;
        }
        config.histogramBins = bins;
    }

    if (parser.isSet(isoOpt)) {
        bool ok = false;
        const double v = parser.value(isoOpt).toDouble(&ok);
        if (!ok) {
            if (errorMsg) *errorMsg = QString("Invalid --isoline '%1'").arg(parser.value(isoOpt));
            return false;
        }
        config.isolineInitial = v;
    }

    if (parser.isSet(noWatchOpt)) config.watchEnabled = false;
    if (parser.isSet(resetOpt)) config.keepPinnedLevelsOnReload = false;
    if (parser.isSet(logOpt)) config.logDir = parser.value(logOpt);

    return true;
}
