#include "BatchConverter.h"
#include "ImageLoader.h"
#include "ImageWriter.h"
#include "ImageBuffer.h"
#include "core/Logger.h"
#include "core/ErrorHandling.h"
#include <QDir>
#include <QFileInfo>

QString BatchConverter::targetPath(const QString& ppmPath) {
    const QFileInfo fi(ppmPath);
    return fi.dir().filePath(fi.completeBaseName() + ".png");
}

bool BatchConverter::convertFile(const QString& ppmPath, QString* errorMsg) {
    ImageBuffer buffer;
    QString err;
    if (!ImageLoader::decode(ppmPath, buffer, errorMsg)) {
        return false;
    }

    const QString target = targetPath(ppmPath);
    if (!ImageWriter::save(target, buffer, &err)) {
        if (errorMsg) *errorMsg = formatError("Failed to write", target, err);
        return false;
    }
    Logger::info(QString("%1 -> %2").arg(ppmPath, target), "imconvert");
    return true;
}

int BatchConverter::run(const QString& path, QStringList* converted, QStringList* errors) {
    const QFileInfo target(path);
    QStringList files;
    if (target.isDir()) {
        const QFileInfoList entries = QDir(target.absoluteFilePath())
            .entryInfoList(QStringList() << "*.ppm", QDir::Files, QDir::Name);
        for (const QFileInfo& fi : entries) files << fi.absoluteFilePath();
        if (files.isEmpty()) {
            if (errors) *errors << formatError("No .ppm files", target.filePath(), "");
            return Exit_Failed;
        }
    } else if (target.isFile()) {
        if (target.suffix().compare("ppm", Qt::CaseInsensitive) != 0) {
            if (errors) *errors << formatError("Not a .ppm file", target.filePath(), "");
            return Exit_Usage;
        }
        files << target.absoluteFilePath();
    } else {
        if (errors) *errors << formatError("No such file or directory", target.filePath(), "");
        return Exit_Failed;
    }

    int failures = 0;
    for (const QString& f : files) {
        QString err;
        if (convertFile(f, &err)) {
            if (converted) *converted << targetPath(f);
        } else {
            if (errors) *errors << err;
            ++failures;
        }
    }
    return failures == 0 ? Exit_Ok : Exit_Failed;
}
