#include "ImageWriter.h"
#include "NetpbmWriter.h"
#include "core/ErrorHandling.h"
#include <QFile>
#include <QFileInfo>
#include <QCoreApplication>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

bool ImageWriter::save(const QString& filePath, const ImageBuffer& buffer, QString* errorMsg) {
    if (!validateBuffer(buffer, errorMsg)) return false;

    const QString suffix = QFileInfo(filePath).suffix().toLower();
    const int maxval = static_cast<int>(std::clamp(buffer.metadata().maxValue, 1.0, 65535.0));

    if (suffix == "ppm" || suffix == "pgm" || suffix == "pnm") {
        return NetpbmWriter::writePlain(filePath, buffer.width(), buffer.height(), buffer.channels(),
                                        buffer.data(), maxval, errorMsg);
    }

    const int ch = buffer.channels();
    cv::Mat floatMat(buffer.height(), buffer.width(), CV_MAKETYPE(CV_32F, ch),
                     const_cast<float*>(buffer.data().data()));

    // Rescale from the source range to the target integer range
    const bool wide = buffer.metadata().bitDepth > 8;
    const double targetMax = wide ? 65535.0 : 255.0;
    const double scale = targetMax / std::max(1e-12, buffer.metadata().maxValue);

    cv::Mat out;
    floatMat.convertTo(out, CV_MAKETYPE(wide ? CV_16U : CV_8U, ch), scale);

    if (ch == 3) {
        cv::cvtColor(out, out, cv::COLOR_RGB2BGR);
    } else if (ch == 4) {
        cv::cvtColor(out, out, cv::COLOR_RGBA2BGRA);
    }

    bool ok = false;
    try {
        ok = cv::imwrite(QFile::encodeName(filePath).toStdString(), out);
    } catch (const cv::Exception& e) {
        if (errorMsg) *errorMsg = formatError("Failed to encode", filePath, QString::fromStdString(e.what()));
        return false;
    }

    if (!ok) {
        if (errorMsg) *errorMsg = formatError("Failed to encode", filePath,
            QCoreApplication::translate("ImageWriter", "unsupported output format"));
        return false;
    }
    return true;
}
