#include "ErrorHandling.h"
#include "Logger.h"
#include "ImageBuffer.h"
#include <QFile>
#include <QFileInfo>

QString errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DecodeError:       return "DecodeError";
        case ErrorKind::WatchError:        return "WatchError";
        case ErrorKind::MalformedGeometry: return "MalformedGeometry";
    }
    return "Error";
}

// ============================================================================
// Error Reporting
// ============================================================================

QString reportError(ErrorKind kind, const QString& message) {
    QString text = QString("%1: %2").arg(errorKindName(kind), message);
    // Geometry fallbacks are expected during drags, keep them out of the console
    Logger::log(kind == ErrorKind::MalformedGeometry ? Logger::Debug : Logger::Error, text, "Error");
    return text;
}

// ============================================================================
// Validation Helpers
// ============================================================================

bool validateFileExists(const QString& path, QString* error) {
    if (path.isEmpty()) {
        if (error) *error = "File path cannot be empty";
        return false;
    }

    QFileInfo info(path);
    if (!info.exists()) {
        if (error) *error = formatError("File not found", path, "");
        return false;
    }

    if (!info.isFile()) {
        if (error) *error = formatError("Not a regular file", path, "");
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = formatError("Cannot open file", path, file.errorString());
        return false;
    }
    file.close();

    return true;
}

bool validateBuffer(const ImageBuffer& buffer, QString* error) {
    if (!buffer.isValid()) {
        if (error) *error = "ImageBuffer is invalid or empty";
        return false;
    }

    const int c = buffer.channels();
    if (c != 1 && c != 3 && c != 4) {
        if (error) *error = QString("Unsupported channel count: %1").arg(c);
        return false;
    }

    if (buffer.data().size() != buffer.size()) {
        if (error) *error = QString("Pixel data size %1 does not match %2x%3x%4")
            .arg(buffer.data().size())
            .arg(buffer.width())
            .arg(buffer.height())
            .arg(c);
        return false;
    }

    return true;
}
