#include "NetpbmWriter.h"
#include <QSaveFile>
#include <QTextStream>
#include <QCoreApplication>
#include <algorithm>
#include <cmath>

bool NetpbmWriter::writePlain(const QString& filename, int width, int height, int channels,
                              const std::vector<float>& data, int maxval, QString* errorMsg) {
    if (width <= 0 || height <= 0 || (channels != 1 && channels != 3 && channels != 4)) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("NetpbmWriter", "Invalid image geometry %1x%2x%3.")
            .arg(width).arg(height).arg(channels);
        return false;
    }
    if (data.size() < static_cast<size_t>(width) * height * channels) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("NetpbmWriter", "Pixel data is smaller than the image geometry.");
        return false;
    }
    maxval = std::clamp(maxval, 1, 65535);

    // QSaveFile commits atomically, so a watcher never sees a half-written image
    QSaveFile file(filename);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("NetpbmWriter", "File open failed: %1").arg(file.errorString());
        return false;
    }

    const int outChannels = channels == 1 ? 1 : 3;
    QTextStream out(&file);
    out << (outChannels == 1 ? "P2" : "P3") << "\n" << width << " " << height << "\n" << maxval << "\n";

    auto quantize = [maxval](float v) {
        if (std::isnan(v)) return 0;
        return static_cast<int>(std::lround(std::clamp(v, 0.0f, static_cast<float>(maxval))));
    };

    const size_t count = static_cast<size_t>(width) * height;
    for (size_t i = 0; i < count; ++i) {
        const float* px = data.data() + i * channels;
        if (outChannels == 1) {
            out << quantize(px[0]) << "\n";
        } else {
            out << quantize(px[0]) << " " << quantize(px[1]) << " " << quantize(px[2]) << "\n";
        }
    }
    out.flush();

    if (!file.commit()) {
        if (errorMsg) *errorMsg = QCoreApplication::translate("NetpbmWriter", "Write failed: %1").arg(file.errorString());
        return false;
    }
    return true;
}
