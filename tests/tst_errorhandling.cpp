#include <QtTest>
#include <QTemporaryDir>
#include "core/ErrorHandling.h"
#include "ImageBuffer.h"
#include "TestUtils.h"

class TestErrorHandling : public QObject {
    Q_OBJECT
private slots:
    void formatOmitsEmptyReason();
    void reportPrefixesKind();
    void resultCarriesKind();
    void fileValidation();
    void bufferValidation();
};

void TestErrorHandling::formatOmitsEmptyReason() {
    QCOMPARE(formatError("File not found", "/tmp/a.ppm", ""), QString("File not found: /tmp/a.ppm"));
    QCOMPARE(formatError("Cannot open file", "a.ppm", "Permission denied"),
             QString("Cannot open file: a.ppm - Permission denied"));
}

void TestErrorHandling::reportPrefixesKind() {
    QCOMPARE(reportError(ErrorKind::DecodeError, "bad header"), QString("DecodeError: bad header"));
    QCOMPARE(reportError(ErrorKind::WatchError, "gone"), QString("WatchError: gone"));
    QCOMPARE(reportError(ErrorKind::MalformedGeometry, "nan"), QString("MalformedGeometry: nan"));
}

void TestErrorHandling::resultCarriesKind() {
    Result<int> ok(42);
    QVERIFY(ok.isSuccess());
    QCOMPARE(ok.value(), 42);

    Result<int> failed(ErrorKind::WatchError, "no such path");
    QVERIFY(!failed);
    QCOMPARE(failed.kind(), ErrorKind::WatchError);
    QCOMPARE(failed.error(), QString("no such path"));
}

void TestErrorHandling::fileValidation() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QString err;
    QVERIFY(!validateFileExists("", &err));
    QVERIFY(!validateFileExists(dir.filePath("missing.ppm"), &err));
    QVERIFY(err.startsWith("File not found: "));
    QVERIFY(!err.contains(" - "));
    QVERIFY(!validateFileExists(dir.path(), &err));
    QVERIFY(err.startsWith("Not a regular file: "));

    const QString path = dir.filePath("a.pgm");
    QVERIFY(TestUtils::writeFile(path, TestUtils::plainPgm(1, 1, {7})));
    QVERIFY(validateFileExists(path, &err));
}

void TestErrorHandling::bufferValidation() {
    QString err;
    QVERIFY(validateBuffer(ImageBuffer(2, 1, 3, std::vector<float>(6, 0.5f)), &err));
    QVERIFY(validateBuffer(ImageBuffer(1, 1, 4, {1, 2, 3, 4}), &err));

    QVERIFY(!validateBuffer(ImageBuffer(1, 1, 2, {1, 2}), &err));
    QVERIFY(err.contains("channel count: 2"));

    QVERIFY(!validateBuffer(ImageBuffer(2, 2, 1, {1, 2, 3}), &err));
    QVERIFY(!validateBuffer(ImageBuffer(), &err));
}

QTEST_GUILESS_MAIN(TestErrorHandling)
#include "tst_errorhandling.moc"
