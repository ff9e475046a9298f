#ifndef IMAGESTORE_H
#define IMAGESTORE_H

#include <QObject>
#include <QString>
#include "ViewerState.h"
#include "core/ErrorHandling.h"

/**
 * @brief Owns the decode/replace protocol of the current image
 *
 * The only writer of ViewerState's current buffer. A failed reload keeps the
 * previous buffer and reports a DecodeError; it never throws.
 */
class ImageStore : public QObject {
    Q_OBJECT
public:
    explicit ImageStore(ViewerState& state, QObject* parent = nullptr);

    /**
     * @brief Decode @p filePath (display orientation), publish it and remember the path
     */
    Result<ViewerState::BufferPtr> load(const QString& filePath);

    /**
     * @brief Decode the watched path again and swap it in
     * @return false on DecodeError, with the previous buffer still current
     */
    bool reload(QString* errorMsg = nullptr);

    ViewerState::BufferPtr current() const { return m_state.currentImage(); }

public slots:
    void onFileChanged(const QString& path);

signals:
    /// Emitted on the event loop after every successful load or reload
    void imageReplaced(bool geometryChanged);
    void reloadFailed(const QString& message);

private:
    void publish(ViewerState::BufferPtr buffer);

    ViewerState& m_state;
};

#endif // IMAGESTORE_H
