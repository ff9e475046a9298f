#include "Logger.h"
#include "Version.h"
#include <QFileInfo>
#include <QStringConverter>
#include <iostream>
#include <csignal>
#include <cstring>

QFile* Logger::s_logFile = nullptr;
QTextStream* Logger::s_logStream = nullptr;
QRecursiveMutex Logger::s_mutex;
QString Logger::s_logDirPath;
QString Logger::s_currentLogPath;
int Logger::s_maxLogFiles = 5;
Logger::Level Logger::s_consoleLevel = Logger::Info;
bool Logger::s_initialized = false;
QtMessageHandler Logger::s_previousHandler = nullptr;

namespace {

const char* const kLogName = "ImView_debug.log";
const qint64 kRotateSize = 4 * 1024 * 1024;

void writeRule(QTextStream& s) {
    s << QString(80, '=') << "\n";
}

void onCrashSignal(int sig)
{
    const char* name = "unknown signal";
    switch (sig) {
        case SIGSEGV: name = "SIGSEGV"; break;
        case SIGABRT: name = "SIGABRT"; break;
        case SIGFPE:  name = "SIGFPE"; break;
        case SIGILL:  name = "SIGILL"; break;
    }
    Logger::critical(QString("Viewer crashed (%1, signal %2)").arg(name).arg(sig), "Crash");
    Logger::shutdown();

    // Default action afterwards, so a core dump is still produced
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

} // namespace

void Logger::init(const QString& logDirPath, int maxLogFiles)
{
    QMutexLocker locker(&s_mutex);
    if (s_initialized) return;

    s_maxLogFiles = maxLogFiles;
    s_logDirPath = logDirPath.isEmpty() ? QCoreApplication::applicationDirPath() + "/logs" : logDirPath;

    if (!QDir().mkpath(s_logDirPath)) {
        std::cerr << "Failed to create log directory: " << s_logDirPath.toStdString() << std::endl;
    }

    rotateLogFiles();

    s_currentLogPath = QDir(s_logDirPath).filePath(kLogName);
    s_logFile = new QFile(s_currentLogPath);
    if (s_logFile->open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Append)) {
        s_logStream = new QTextStream(s_logFile);
        s_logStream->setEncoding(QStringConverter::Utf8);
        writeRule(*s_logStream);
        *s_logStream << "ImView " << ImView::getVersion() << " session started "
                     << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
        writeRule(*s_logStream);
        s_logStream->flush();
    } else {
        // Console only; viewing does not depend on the log file
        std::cerr << "Failed to open log file: " << s_currentLogPath.toStdString() << std::endl;
        delete s_logFile;
        s_logFile = nullptr;
        s_currentLogPath.clear();
    }

    s_previousHandler = qInstallMessageHandler(qtMessageHandler);
    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGILL}) std::signal(sig, onCrashSignal);

    s_initialized = true;
    if (!s_currentLogPath.isEmpty()) log(Debug, QString("Log file: %1").arg(s_currentLogPath), "Logger");
}

void Logger::shutdown()
{
    QMutexLocker locker(&s_mutex);
    if (!s_initialized) return;

    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;

    if (s_logStream) {
        writeRule(*s_logStream);
        *s_logStream << "session ended " << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n\n";
        s_logStream->flush();
        delete s_logStream;
        s_logStream = nullptr;
    }
    if (s_logFile) {
        s_logFile->close();
        delete s_logFile;
        s_logFile = nullptr;
    }

    s_initialized = false;
}

void Logger::setConsoleLevel(Level level)
{
    QMutexLocker locker(&s_mutex);
    s_consoleLevel = level;
}

void Logger::log(Level level, const QString& message, const QString& category)
{
    QMutexLocker locker(&s_mutex);

    if (s_logStream) {
        *s_logStream << "[" << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz") << "] "
                     << "[" << QString("%1").arg(levelToString(level), -8) << "] ";
        if (!category.isEmpty()) *s_logStream << "[" << category << "] ";
        *s_logStream << message << "\n";
        s_logStream->flush();
    }

    // Bare message on the terminal, the way a command-line tool prints
    if (level >= s_consoleLevel) {
        std::cerr << message.toStdString() << std::endl;
    }
}

void Logger::qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Level level = Info;
    if (type == QtDebugMsg) level = Debug;
    else if (type == QtWarningMsg) level = Warning;
    else if (type == QtCriticalMsg) level = Critical;
    else if (type == QtFatalMsg) level = Fatal;

    const bool namedCategory = context.category && std::strcmp(context.category, "default") != 0;
    log(level, msg, namedCategory ? QString::fromUtf8(context.category) : QString());

    if (type == QtFatalMsg) {
        shutdown();
        std::abort();
    }
}

void Logger::rotateLogFiles()
{
    QDir dir(s_logDirPath);
    const QFileInfo current(dir.filePath(kLogName));
    if (!current.exists() || current.size() < kRotateSize) return;

    const QString archived = dir.filePath(
        QString("ImView_%1.log").arg(QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss")));
    if (!QFile::rename(current.absoluteFilePath(), archived)) {
        std::cerr << "Failed to rotate log file: " << current.absoluteFilePath().toStdString() << std::endl;
        return;
    }

    // Oldest archives go first
    QFileInfoList archives = dir.entryInfoList(QStringList() << "ImView_2*.log", QDir::Files, QDir::Time);
    while (archives.size() > s_maxLogFiles) {
        QFile::remove(archives.takeLast().absoluteFilePath());
    }
}

QString Logger::levelToString(Level level)
{
    static const char* const names[] = {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL", "FATAL"};
    const int i = static_cast<int>(level);
    return (i >= 0 && i <= Fatal) ? names[i] : "UNKNOWN";
}

QString Logger::currentLogFile()
{
    QMutexLocker locker(&s_mutex);
    return s_currentLogPath;
}
