#ifndef IMAGELOADER_H
#define IMAGELOADER_H

#include <QString>
#include "ImageBuffer.h"

/**
 * @brief Decodes raster files into ImageBuffer
 *
 * PGM/PPM goes through NetpbmReader (strict, rejects truncated data).
 * Everything else goes through OpenCV (IMREAD_UNCHANGED, native bit depth),
 * with QImage as a last resort for formats OpenCV was built without.
 */
class ImageLoader {
public:
    /**
     * @brief Decode in display orientation (row 0 = bottom of the image)
     */
    static bool load(const QString& filePath, ImageBuffer& buffer, QString* errorMsg = nullptr);

    /**
     * @brief Decode in file orientation (row 0 = top of the image)
     */
    static bool decode(const QString& filePath, ImageBuffer& buffer, QString* errorMsg = nullptr);

private:
    static bool decodeOpenCV(const QString& filePath, ImageBuffer& buffer, QString* errorMsg);
    static bool decodeQImage(const QString& filePath, ImageBuffer& buffer, QString* errorMsg);
};

#endif // IMAGELOADER_H
