#ifndef FILEWATCHER_H
#define FILEWATCHER_H

#include <QObject>
#include <QFileSystemWatcher>
#include <QDateTime>
#include <QTimer>
#include <QString>

/**
 * @brief Watches one file and posts a coalesced change message on the event loop
 *
 * OS notifications (QFileSystemWatcher) start a single-shot debounce timer;
 * every notification arriving before it fires folds into one fileChanged().
 * A poll timer compares size/mtime as a fallback and re-arms the OS watch
 * after the file was removed or replaced by rename, so editors that save via
 * a temporary file keep working. fileChanged() is always emitted on the
 * thread that owns the watcher.
 */
class FileWatcher : public QObject {
    Q_OBJECT
public:
    explicit FileWatcher(QObject* parent = nullptr);

    /**
     * @brief Start watching @p path (replaces any previous path)
     * @return false if the path cannot be monitored (WatchError)
     */
    bool watch(const QString& path, QString* errorMsg = nullptr);
    void stop();

    bool isActive() const { return m_active; }
    QString path() const { return m_path; }

    void setDebounceInterval(int ms) { m_debounce.setInterval(ms); }
    void setPollInterval(int ms) { m_poll.setInterval(ms); }
    int debounceInterval() const { return m_debounce.interval(); }

signals:
    void fileChanged(const QString& path);

private slots:
    void onNotified(const QString& path);
    void onDebounceTimeout();
    void onPollTimeout();

private:
    struct Signature {
        bool exists = false;
        qint64 size = -1;
        QDateTime modified;
        bool operator==(const Signature& o) const { return exists == o.exists && size == o.size && modified == o.modified; }
        bool operator!=(const Signature& o) const { return !(*this == o); }
    };

    Signature currentSignature() const;
    void rearm();
    void schedule();

    QFileSystemWatcher m_watcher;
    QTimer m_debounce;
    QTimer m_poll;
    QString m_path;
    Signature m_lastSeen;
    bool m_active = false;
};

#endif // FILEWATCHER_H
