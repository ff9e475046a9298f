#ifndef BATCHCONVERTER_H
#define BATCHCONVERTER_H

#include <QString>
#include <QStringList>

/**
 * @brief PPM to PNG conversion behind the imconvert tool
 *
 * run() takes a .ppm file or a directory and converts every .ppm it names
 * to a .png beside it. The return value is the process exit code.
 */
class BatchConverter {
public:
    enum ExitCode {
        Exit_Ok = 0,
        Exit_Failed = 1,   // missing path, empty directory or a failed conversion
        Exit_Usage = 2     // wrong argument count or not a .ppm file
    };

    // Same directory and base name, .png suffix
    static QString targetPath(const QString& ppmPath);

    static bool convertFile(const QString& ppmPath, QString* errorMsg = nullptr);

    // Every conversion is attempted; @p converted receives the written paths
    static int run(const QString& path, QStringList* converted = nullptr, QStringList* errors = nullptr);
};

#endif // BATCHCONVERTER_H
