#include "FileWatcher.h"
#include "ErrorHandling.h"
#include "Logger.h"
#include <QFileInfo>

FileWatcher::FileWatcher(QObject* parent)
    : QObject(parent)
{
    m_debounce.setSingleShot(true);
    m_debounce.setInterval(50);
    m_poll.setInterval(250);

    connect(&m_watcher, &QFileSystemWatcher::fileChanged, this, &FileWatcher::onNotified);
    connect(&m_debounce, &QTimer::timeout, this, &FileWatcher::onDebounceTimeout);
    connect(&m_poll, &QTimer::timeout, this, &FileWatcher::onPollTimeout);
}

bool FileWatcher::watch(const QString& path, QString* errorMsg) {
    stop();

    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        if (errorMsg) *errorMsg = formatError("Cannot watch", path, "file does not exist");
        return false;
    }
    if (!info.isReadable()) {
        if (errorMsg) *errorMsg = formatError("Cannot watch", path, "permission denied");
        return false;
    }

    const QString absPath = info.absoluteFilePath();
    if (!m_watcher.addPath(absPath)) {
        if (errorMsg) *errorMsg = formatError("Cannot watch", path, "file system notification unavailable");
        return false;
    }

    m_path = absPath;
    m_lastSeen = currentSignature();
    m_active = true;
    m_poll.start();

    Logger::debug(QString("Watching %1").arg(m_path), "FileWatcher");
    return true;
}

void FileWatcher::stop() {
    m_debounce.stop();
    m_poll.stop();
    if (!m_watcher.files().isEmpty()) m_watcher.removePaths(m_watcher.files());
    m_active = false;
    m_path.clear();
}

FileWatcher::Signature FileWatcher::currentSignature() const {
    Signature s;
    QFileInfo info(m_path);
    if (!info.exists()) return s;
    s.exists = true;
    s.size = info.size();
    s.modified = info.lastModified();
    return s;
}

void FileWatcher::rearm() {
    // QFileSystemWatcher drops a path once the file is removed or renamed over
    if (!m_watcher.files().contains(m_path) && QFileInfo::exists(m_path)) {
        if (m_watcher.addPath(m_path)) {
            Logger::debug(QString("Re-armed watch on %1").arg(m_path), "FileWatcher");
        }
    }
}

void FileWatcher::schedule() {
    // Not restarted while pending: the delay after the first write stays bounded
    if (!m_debounce.isActive()) m_debounce.start();
}

void FileWatcher::onNotified(const QString& path) {
    Q_UNUSED(path);
    if (!m_active) return;
    schedule();
}

void FileWatcher::onDebounceTimeout() {
    if (!m_active) return;
    rearm();
    m_lastSeen = currentSignature();
    emit fileChanged(m_path);
}

void FileWatcher::onPollTimeout() {
    if (!m_active) return;
    rearm();
    if (currentSignature() != m_lastSeen) schedule();
}
