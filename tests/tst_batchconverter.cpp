#include <QtTest>
#include <QTemporaryDir>
#include "io/BatchConverter.h"
#include "io/ImageLoader.h"
#include "ImageBuffer.h"
#include "TestUtils.h"

class TestBatchConverter : public QObject {
    Q_OBJECT
private slots:
    void pngBesideSource();
    void convertsSingleFile();
    void directoryReportsFailures();
    void rejectsOtherSuffix();
    void missingPathFails();
    void emptyDirectoryFails();
};

void TestBatchConverter::pngBesideSource() {
    QCOMPARE(BatchConverter::targetPath("/data/frames/out.ppm"), QString("/data/frames/out.png"));
    QCOMPARE(BatchConverter::targetPath("/data/render.v2.ppm"), QString("/data/render.v2.png"));
}

void TestBatchConverter::convertsSingleFile() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString ppm = dir.filePath("a.ppm");
    QVERIFY(TestUtils::writeFile(ppm, TestUtils::plainPpm(2, 1, {255, 0, 0, 0, 0, 255})));

    QStringList converted;
    QStringList errors;
    QCOMPARE(BatchConverter::run(ppm, &converted, &errors), int(BatchConverter::Exit_Ok));
    QVERIFY(errors.isEmpty());
    QCOMPARE(converted.size(), 1);

    const QString png = dir.filePath("a.png");
    QVERIFY(QFileInfo::exists(png));

    // Written in file orientation, so decoding gives back the same pixels
    ImageBuffer decoded;
    QVERIFY(ImageLoader::decode(png, decoded));
    QCOMPARE(decoded.width(), 2);
    QCOMPARE(decoded.height(), 1);
    QCOMPARE(decoded.channels(), 3);
}

void TestBatchConverter::directoryReportsFailures() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(TestUtils::writeFile(dir.filePath("good.ppm"), TestUtils::plainPpm(1, 1, {10, 20, 30})));
    QVERIFY(TestUtils::writeFile(dir.filePath("bad.ppm"), QByteArray("P3\n2 2\n255\n1 2 3\n")));
    QVERIFY(TestUtils::writeFile(dir.filePath("notes.txt"), QByteArray("not an image")));

    QStringList converted;
    QStringList errors;
    QCOMPARE(BatchConverter::run(dir.path(), &converted, &errors), int(BatchConverter::Exit_Failed));

    // The bad file does not stop the good one
    QCOMPARE(converted.size(), 1);
    QVERIFY(QFileInfo::exists(dir.filePath("good.png")));
    QVERIFY(!QFileInfo::exists(dir.filePath("bad.png")));
    QVERIFY(!QFileInfo::exists(dir.filePath("notes.png")));
    QCOMPARE(errors.size(), 1);
    QVERIFY(errors.first().contains("bad.ppm"));
}

void TestBatchConverter::rejectsOtherSuffix() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString pgm = dir.filePath("a.pgm");
    QVERIFY(TestUtils::writeFile(pgm, TestUtils::plainPgm(1, 1, {7})));

    QStringList errors;
    QCOMPARE(BatchConverter::run(pgm, nullptr, &errors), int(BatchConverter::Exit_Usage));
    QVERIFY(!QFileInfo::exists(dir.filePath("a.png")));
    QCOMPARE(errors.size(), 1);
}

void TestBatchConverter::missingPathFails() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QCOMPARE(BatchConverter::run(dir.filePath("nope.ppm")), int(BatchConverter::Exit_Failed));
}

void TestBatchConverter::emptyDirectoryFails() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QStringList errors;
    QCOMPARE(BatchConverter::run(dir.path(), nullptr, &errors), int(BatchConverter::Exit_Failed));
    QVERIFY(errors.first().startsWith("No .ppm files"));
}

QTEST_GUILESS_MAIN(TestBatchConverter)
#include "tst_batchconverter.moc"
