#ifndef VIEWERCONFIG_H
#define VIEWERCONFIG_H

#include <QSize>
#include <QString>
#include <QStringList>

class QSettings;

/**
 * @brief Startup configuration: QSettings defaults overridden by the command line
 *
 * Read once at startup and never written back; the viewer keeps no state
 * between sessions.
 */
struct ViewerConfig {
    QString imagePath;
    QString windowTitle = "simple image viewer";
    QSize windowSize = QSize(800, 450);
    QString iconPath;
    int histogramBins = 256;
    double isolineInitial = 0.8;
    bool watchEnabled = true;
    int debounceMs = 50;
    int pollMs = 250;
    bool keepPinnedLevelsOnReload = true;
    QString logDir;

    /**
     * @brief Values from @p settings, with application-relative defaults
     */
    static ViewerConfig fromSettings(const QSettings& settings, const QString& appDir);

    /**
     * @brief Apply command-line options to @p config
     * @return false on a usage error, with a message in @p errorMsg
     */
    static bool applyArguments(ViewerConfig& config, const QStringList& arguments, QString* errorMsg = nullptr);

    // <app dir>/../out/latest.ppm
    static QString defaultImagePath(const QString& appDir);
};

#endif // VIEWERCONFIG_H
