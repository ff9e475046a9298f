#ifndef NETPBMWRITER_H
#define NETPBMWRITER_H

#include <QString>
#include <vector>

/**
 * @brief Writer for plain (ASCII) PGM/PPM
 *
 * 1 channel writes P2, 3 or 4 channels write P3 (alpha is dropped).
 * Rows are written in data order; samples are rounded and clamped to [0, maxval].
 */
class NetpbmWriter {
public:
    static bool writePlain(const QString& filename, int width, int height, int channels,
                           const std::vector<float>& data, int maxval = 255, QString* errorMsg = nullptr);
};

#endif // NETPBMWRITER_H
