#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QRecursiveMutex>
#include <QDateTime>
#include <QDir>
#include <QCoreApplication>
#include <QTextStream>
#include <QDebug>

/**
 * @brief Process-wide log for ImView
 *
 * Writes `[time] [LEVEL] [Category] message` lines to ImView_debug.log in the
 * log directory and echoes the bare message to stderr from the console level
 * up, so reloads and decode failures show on the launching terminal. Qt's own
 * messages are routed through the same sink once init() has run. Safe to call
 * before init(): messages then only reach the console.
 */
class Logger
{
public:
    enum Level {
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Fatal
    };

    /**
     * @param logDirPath Directory of the log file (default <app dir>/logs)
     * @param maxLogFiles Archived files kept after rotation
     */
    static void init(const QString& logDirPath = QString(), int maxLogFiles = 5);
    static void shutdown();

    static void log(Level level, const QString& message, const QString& category = QString());

    // Empty when file logging is off
    static QString currentLogFile();

    static void setConsoleLevel(Level level);

    static void debug(const QString& msg, const QString& cat = QString())    { log(Debug, msg, cat); }
    static void info(const QString& msg, const QString& cat = QString())     { log(Info, msg, cat); }
    static void warning(const QString& msg, const QString& cat = QString())  { log(Warning, msg, cat); }
    static void error(const QString& msg, const QString& cat = QString())    { log(Error, msg, cat); }
    static void critical(const QString& msg, const QString& cat = QString()) { log(Critical, msg, cat); }

private:
    Logger() = default;

    static void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
    static void rotateLogFiles();
    static QString levelToString(Level level);

    static QFile* s_logFile;
    static QTextStream* s_logStream;
    static QRecursiveMutex s_mutex;
    static QString s_logDirPath;
    static QString s_currentLogPath;
    static int s_maxLogFiles;
    static Level s_consoleLevel;
    static bool s_initialized;
    static QtMessageHandler s_previousHandler;
};

#endif // LOGGER_H
