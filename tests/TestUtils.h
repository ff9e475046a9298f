#ifndef TESTUTILS_H
#define TESTUTILS_H

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QStringList>
#include <vector>

namespace TestUtils {

// Writes @p bytes to @p path in one go, replacing the previous content
inline bool writeFile(const QString& path, const QByteArray& bytes) {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    const bool ok = f.write(bytes) == bytes.size();
    f.close();
    return ok;
}

// Plain PGM, rows given top to bottom as in the file
inline QByteArray plainPgm(int width, int height, const std::vector<int>& samples, int maxval = 255) {
    QByteArray out = QString("P2\n%1 %2\n%3\n").arg(width).arg(height).arg(maxval).toLatin1();
    for (size_t i = 0; i < samples.size(); ++i) {
        out += QByteArray::number(samples[i]);
        out += ((i + 1) % width == 0) ? '\n' : ' ';
    }
    return out;
}

// Plain PPM, interleaved RGB, rows top to bottom
inline QByteArray plainPpm(int width, int height, const std::vector<int>& samples, int maxval = 255) {
    QByteArray out = QString("P3\n%1 %2\n%3\n").arg(width).arg(height).arg(maxval).toLatin1();
    for (size_t i = 0; i < samples.size(); ++i) {
        out += QByteArray::number(samples[i]);
        out += ((i + 1) % (width * 3) == 0) ? '\n' : ' ';
    }
    return out;
}

} // namespace TestUtils

#endif // TESTUTILS_H
