#ifndef NETPBMREADER_H
#define NETPBMREADER_H

#include <QByteArray>
#include <QString>
#include <vector>

/**
 * @brief Strict reader for PGM/PPM (P2, P3, P5, P6)
 *
 * Samples are returned in file order (row 0 = top) and in the file's native
 * range [0, maxval]. A payload shorter than the header announces is an error,
 * so a file caught in the middle of a rewrite never decodes.
 */
class NetpbmReader {
public:
    struct Header {
        char magic = 0;     // '2', '3', '5' or '6'
        int width = 0;
        int height = 0;
        int channels = 0;
        int maxval = 0;
        qsizetype dataOffset = 0;
    };

    // True for the magics this reader handles (P2, P3, P5, P6)
    static bool canRead(const QByteArray& head);

    static bool parseHeader(const QByteArray& bytes, Header& header, QString* errorMsg = nullptr);

    static bool read(const QString& path, int& width, int& height, int& channels, int& maxval,
                     std::vector<float>& data, QString* errorMsg = nullptr);

    static bool decode(const QByteArray& bytes, int& width, int& height, int& channels, int& maxval,
                       std::vector<float>& data, QString* errorMsg = nullptr);
};

#endif // NETPBMREADER_H
