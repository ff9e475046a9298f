#include "ImageLoader.h"
#include "NetpbmReader.h"
#include "core/ErrorHandling.h"
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QCoreApplication>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

bool ImageLoader::load(const QString& filePath, ImageBuffer& buffer, QString* errorMsg) {
    ImageBuffer decoded;
    if (!decode(filePath, decoded, errorMsg)) return false;
    buffer = decoded.flippedVertically();
    return true;
}

bool ImageLoader::decode(const QString& filePath, ImageBuffer& buffer, QString* errorMsg) {
    if (!validateFileExists(filePath, errorMsg)) return false;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMsg) *errorMsg = formatError("Cannot open file", filePath, file.errorString());
        return false;
    }
    const QByteArray head = file.peek(2);
    file.close();

    bool ok = false;
    QString err;
    if (NetpbmReader::canRead(head)) {
        int w = 0, h = 0, c = 0, maxval = 0;
        std::vector<float> data;
        ok = NetpbmReader::read(filePath, w, h, c, maxval, data, &err);
        if (ok) {
            ImageBuffer::Metadata meta;
            meta.filePath = filePath;
            meta.format = QString("%1 (P%2)").arg(c == 3 ? "PPM" : "PGM").arg(head[1]);
            meta.bitDepth = maxval < 256 ? 8 : 16;
            meta.maxValue = maxval;
            buffer = ImageBuffer(w, h, c, std::move(data), meta);
        }
    } else {
        ok = decodeOpenCV(filePath, buffer, &err);
        if (!ok) {
            QString qtErr;
            ok = decodeQImage(filePath, buffer, &qtErr);
            if (!ok) err = err.isEmpty() ? qtErr : err;
        }
    }

    if (!ok) {
        if (errorMsg) *errorMsg = formatError("Failed to decode", filePath, err);
        return false;
    }

    return validateBuffer(buffer, errorMsg);
}

bool ImageLoader::decodeOpenCV(const QString& filePath, ImageBuffer& buffer, QString* errorMsg) {
    cv::Mat img;
    try {
        // IMREAD_UNCHANGED preserves bit depth and channel count
        img = cv::imread(QFile::encodeName(filePath).toStdString(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        if (errorMsg) *errorMsg = QString::fromStdString(e.what());
        return false;
    }

    if (img.empty()) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("ImageLoader", "Unsupported or corrupt image format.");
        return false;
    }

    int ch = img.channels();
    if (ch == 3) {
        cv::cvtColor(img, img, cv::COLOR_BGR2RGB);
    } else if (ch == 4) {
        cv::cvtColor(img, img, cv::COLOR_BGRA2RGBA);
    } else if (ch != 1) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("ImageLoader", "Unsupported channel count: %1").arg(ch);
        return false;
    }

    ImageBuffer::Metadata meta;
    meta.filePath = filePath;
    meta.format = QFileInfo(filePath).suffix().toUpper();

    switch (img.depth()) {
        case CV_8U:  meta.bitDepth = 8;  meta.maxValue = 255.0; break;
        case CV_8S:  meta.bitDepth = 8;  meta.maxValue = 127.0; break;
        case CV_16U: meta.bitDepth = 16; meta.maxValue = 65535.0; break;
        case CV_16S: meta.bitDepth = 16; meta.maxValue = 32767.0; break;
        case CV_32S: meta.bitDepth = 32; meta.maxValue = 2147483647.0; break;
        default:     meta.bitDepth = 32; meta.maxValue = 1.0; break;
    }

    // Keep native values; the level window does the normalization
    cv::Mat floatMat;
    img.convertTo(floatMat, CV_MAKETYPE(CV_32F, ch));
    if (!floatMat.isContinuous()) floatMat = floatMat.clone();

    const size_t n = static_cast<size_t>(floatMat.rows) * floatMat.cols * ch;
    const float* src = floatMat.ptr<float>(0);
    std::vector<float> data(src, src + n);

    buffer = ImageBuffer(floatMat.cols, floatMat.rows, ch, std::move(data), meta);
    return true;
}

bool ImageLoader::decodeQImage(const QString& filePath, ImageBuffer& buffer, QString* errorMsg) {
    QImage img(filePath);
    if (img.isNull()) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("ImageLoader", "Unsupported or corrupt image format.");
        return false;
    }

    int ch = 3;
    if (img.hasAlphaChannel()) {
        img = img.convertToFormat(QImage::Format_RGBA8888);
        ch = 4;
    } else if (img.isGrayscale()) {
        img = img.convertToFormat(QImage::Format_Grayscale8);
        ch = 1;
    } else {
        img = img.convertToFormat(QImage::Format_RGB888);
    }

    const int w = img.width();
    const int h = img.height();
    std::vector<float> data(static_cast<size_t>(w) * h * ch);
    for (int y = 0; y < h; ++y) {
        const uchar* line = img.constScanLine(y);
        float* dst = data.data() + static_cast<size_t>(y) * w * ch;
        for (int i = 0; i < w * ch; ++i) dst[i] = static_cast<float>(line[i]);
    }

    ImageBuffer::Metadata meta;
    meta.filePath = filePath;
    meta.format = QFileInfo(filePath).suffix().toUpper();
    buffer = ImageBuffer(w, h, ch, std::move(data), meta);
    return true;
}
