#ifndef IMAGEWRITER_H
#define IMAGEWRITER_H

#include <QString>
#include "ImageBuffer.h"

/**
 * @brief Encodes an ImageBuffer in file orientation (row 0 = top)
 *
 * .ppm/.pgm are written as plain Netpbm; other extensions go through
 * cv::imwrite at 8 or 16 bits depending on the source bit depth.
 */
class ImageWriter {
public:
    static bool save(const QString& filePath, const ImageBuffer& buffer, QString* errorMsg = nullptr);
};

#endif // IMAGEWRITER_H
