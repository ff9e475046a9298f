#include "ImageStore.h"
#include "io/ImageLoader.h"
#include "core/Logger.h"
#include <QFileInfo>

ImageStore::ImageStore(ViewerState& state, QObject* parent)
    : QObject(parent), m_state(state)
{
}

Result<ViewerState::BufferPtr> ImageStore::load(const QString& filePath) {
    Logger::info(QString("loading : %1").arg(filePath), "ImageStore");

    ImageBuffer decoded;
    QString err;
    if (!ImageLoader::load(filePath, decoded, &err)) {
        return Result<ViewerState::BufferPtr>(ErrorKind::DecodeError, err);
    }

    auto buffer = std::make_shared<const ImageBuffer>(std::move(decoded));
    m_state.setWatchedPath(filePath);
    publish(buffer);
    return Result<ViewerState::BufferPtr>(buffer);
}

bool ImageStore::reload(QString* errorMsg) {
    const QString path = m_state.watchedPath();
    Logger::info(QString("reloading file: %1").arg(path), "ImageStore");

    ImageBuffer decoded;
    QString err;
    if (!ImageLoader::load(path, decoded, &err)) {
        const QString msg = reportError(ErrorKind::DecodeError, err);
        if (errorMsg) *errorMsg = msg;
        emit reloadFailed(msg);
        return false;
    }

    publish(std::make_shared<const ImageBuffer>(std::move(decoded)));
    return true;
}

void ImageStore::onFileChanged(const QString& path) {
    if (QFileInfo(path).absoluteFilePath() != QFileInfo(m_state.watchedPath()).absoluteFilePath()) {
        Logger::debug(QString("Ignoring change of unrelated path %1").arg(path), "ImageStore");
        return;
    }
    reload();
}

void ImageStore::publish(ViewerState::BufferPtr buffer) {
    const ViewerState::BufferPtr previous = m_state.currentImage();
    const bool geometryChanged = !previous ||
        previous->width() != buffer->width() ||
        previous->height() != buffer->height() ||
        previous->channels() != buffer->channels();

    m_state.publishImage(std::move(buffer));
    emit imageReplaced(geometryChanged);
}
