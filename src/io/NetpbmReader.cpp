#include "NetpbmReader.h"
#include <QFile>
#include <QCoreApplication>
#include <cctype>
#include <limits>

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Skips whitespace and '#' comments (which run to end of line)
void skipFiller(const QByteArray& b, qsizetype& pos) {
    while (pos < b.size()) {
        if (isSpace(b[pos])) {
            ++pos;
        } else if (b[pos] == '#') {
            while (pos < b.size() && b[pos] != '\n' && b[pos] != '\r') ++pos;
        } else {
            break;
        }
    }
}

// Unsigned decimal token; false on EOF or non-digit
bool readUInt(const QByteArray& b, qsizetype& pos, long long& out) {
    skipFiller(b, pos);
    if (pos >= b.size() || !std::isdigit(static_cast<unsigned char>(b[pos]))) return false;

    long long v = 0;
    while (pos < b.size() && std::isdigit(static_cast<unsigned char>(b[pos]))) {
        v = v * 10 + (b[pos] - '0');
        if (v > std::numeric_limits<int>::max()) return false;
        ++pos;
    }
    out = v;
    return true;
}

QString tr(const char* text) {
    return QCoreApplication::translate("NetpbmReader", text);
}

} // namespace

bool NetpbmReader::canRead(const QByteArray& head) {
    if (head.size() < 2 || head[0] != 'P') return false;
    const char m = head[1];
    return m == '2' || m == '3' || m == '5' || m == '6';
}

bool NetpbmReader::parseHeader(const QByteArray& bytes, Header& header, QString* errorMsg) {
    if (!canRead(bytes)) {
        if (errorMsg) *errorMsg = tr("Not a PGM/PPM file (unknown magic number).");
        return false;
    }

    header = Header();
    header.magic = bytes[1];
    header.channels = (header.magic == '3' || header.magic == '6') ? 3 : 1;

    qsizetype pos = 2;
    long long w = 0, h = 0, maxval = 0;
    if (!readUInt(bytes, pos, w) || !readUInt(bytes, pos, h) || !readUInt(bytes, pos, maxval)) {
        if (errorMsg) *errorMsg = tr("Truncated or malformed Netpbm header.");
        return false;
    }

    if (w <= 0 || h <= 0) {
        if (errorMsg) *errorMsg = tr("Invalid image dimensions %1x%2.").arg(w).arg(h);
        return false;
    }
    if (maxval <= 0 || maxval > 65535) {
        if (errorMsg) *errorMsg = tr("Invalid maxval %1 (must be 1..65535).").arg(maxval);
        return false;
    }

    // Exactly one whitespace character separates the header from binary data
    if (pos >= bytes.size() || !isSpace(bytes[pos])) {
        if (errorMsg) *errorMsg = tr("Missing pixel data after header.");
        return false;
    }
    ++pos;

    header.width = static_cast<int>(w);
    header.height = static_cast<int>(h);
    header.maxval = static_cast<int>(maxval);
    header.dataOffset = pos;
    return true;
}

bool NetpbmReader::read(const QString& path, int& width, int& height, int& channels, int& maxval,
                        std::vector<float>& data, QString* errorMsg) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMsg) *errorMsg = tr("File open failed: %1").arg(file.errorString());
        return false;
    }
    const QByteArray bytes = file.readAll();
    file.close();

    return decode(bytes, width, height, channels, maxval, data, errorMsg);
}

bool NetpbmReader::decode(const QByteArray& bytes, int& width, int& height, int& channels, int& maxval,
                          std::vector<float>& data, QString* errorMsg) {
    Header hdr;
    if (!parseHeader(bytes, hdr, errorMsg)) return false;

    const size_t count = static_cast<size_t>(hdr.width) * hdr.height * hdr.channels;
    const size_t available = static_cast<size_t>(bytes.size() - hdr.dataOffset);
    const bool binary = hdr.magic == '5' || hdr.magic == '6';
    const int bytesPerSample = binary ? (hdr.maxval < 256 ? 1 : 2) : 1;

    // Checked before allocating: a plain sample takes at least one byte too
    if (available / bytesPerSample < count) {
        if (errorMsg) *errorMsg = tr("Truncated pixel data: expected %1 samples, file holds at most %2.")
            .arg(count).arg(available / bytesPerSample);
        return false;
    }
    std::vector<float> out(count);

    if (binary) {
        const size_t needed = count * bytesPerSample;
        if (available < needed) {
            if (errorMsg) *errorMsg = tr("Truncated pixel data: expected %1 bytes, found %2.")
                .arg(needed).arg(available);
            return false;
        }

        const unsigned char* p = reinterpret_cast<const unsigned char*>(bytes.constData() + hdr.dataOffset);
        for (size_t i = 0; i < count; ++i) {
            int v = bytesPerSample == 1 ? p[i] : (p[2 * i] << 8) | p[2 * i + 1];
            if (v > hdr.maxval) {
                if (errorMsg) *errorMsg = tr("Sample value %1 exceeds maxval %2.").arg(v).arg(hdr.maxval);
                return false;
            }
            out[i] = static_cast<float>(v);
        }
    } else {
        qsizetype pos = hdr.dataOffset;
        for (size_t i = 0; i < count; ++i) {
            long long v = 0;
            if (!readUInt(bytes, pos, v)) {
                if (errorMsg) *errorMsg = tr("Truncated pixel data: expected %1 samples, found %2.")
                    .arg(count).arg(i);
                return false;
            }
            if (v > hdr.maxval) {
                if (errorMsg) *errorMsg = tr("Sample value %1 exceeds maxval %2.").arg(v).arg(hdr.maxval);
                return false;
            }
            out[i] = static_cast<float>(v);
        }
    }

    width = hdr.width;
    height = hdr.height;
    channels = hdr.channels;
    maxval = hdr.maxval;
    data = std::move(out);
    return true;
}
