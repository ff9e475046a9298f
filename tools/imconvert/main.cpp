#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include "io/BatchConverter.h"
#include "core/Version.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("imconvert");
    QCoreApplication::setApplicationVersion(ImView::getVersion());

    QCommandLineParser parser;
    parser.setApplicationDescription("Convert PPM images to PNG");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("path", "A .ppm file, or a directory whose .ppm files are converted");
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << parser.helpText();
        return BatchConverter::Exit_Usage;
    }

    QStringList converted;
    QStringList errors;
    const int code = BatchConverter::run(args.first(), &converted, &errors);
    for (const QString& png : converted) out << png << Qt::endl;
    for (const QString& e : errors) err << e << Qt::endl;
    return code;
}
