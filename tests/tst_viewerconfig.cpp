#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>
#include "core/ViewerConfig.h"

class TestViewerConfig : public QObject {
    Q_OBJECT
private slots:
    void defaults();
    void settingsOverrideDefaults();
    void invalidSettingsFallBack();
    void argumentsOverrideSettings();
    void positionalPath();
    void badSize_data();
    void badSize();
    void unknownOption();
};

void TestViewerConfig::defaults() {
    QTemporaryDir dir;
    QSettings settings(dir.filePath("empty.ini"), QSettings::IniFormat);
    const ViewerConfig c = ViewerConfig::fromSettings(settings, "/opt/imview/bin");

    QCOMPARE(c.imagePath, QString("/opt/imview/out/latest.ppm"));
    QCOMPARE(c.windowTitle, QString("simple image viewer"));
    QCOMPARE(c.windowSize, QSize(800, 450));
    QCOMPARE(c.histogramBins, 256);
    QCOMPARE(c.isolineInitial, 0.8);
    QVERIFY(c.watchEnabled);
    QCOMPARE(c.debounceMs, 50);
    QVERIFY(c.keepPinnedLevelsOnReload);
}

void TestViewerConfig::settingsOverrideDefaults() {
    QTemporaryDir dir;
    QSettings settings(dir.filePath("viewer.ini"), QSettings::IniFormat);
    settings.setValue("window/title", "density");
    settings.setValue("window/width", 1024);
    settings.setValue("histogram/bins", 64);
    settings.setValue("watch/enabled", false);
    settings.sync();

    const ViewerConfig c = ViewerConfig::fromSettings(settings, dir.path());
    QCOMPARE(c.windowTitle, QString("density"));
    QCOMPARE(c.windowSize, QSize(1024, 450));
    QCOMPARE(c.histogramBins, 64);
    QVERIFY(!c.watchEnabled);
}

void TestViewerConfig::invalidSettingsFallBack() {
    QTemporaryDir dir;
    QSettings settings(dir.filePath("bad.ini"), QSettings::IniFormat);
    settings.setValue("window/height", -3);
    settings.setValue("histogram/bins", 0);
    settings.setValue("watch/pollMs", 0);

    const ViewerConfig c = ViewerConfig::fromSettings(settings, dir.path());
    QCOMPARE(c.windowSize, QSize(800, 450));
    QCOMPARE(c.histogramBins, 256);
    QCOMPARE(c.pollMs, 250);
}

void TestViewerConfig::argumentsOverrideSettings() {
    ViewerConfig c;
    QString err;
    QVERIFY2(ViewerConfig::applyArguments(c, {"imview", "--size", "640x480", "--bins", "32", "--isoline", "-1.5",
                                              "--no-watch", "--reset-levels", "--log-dir", "/tmp/logs"}, &err),
             qPrintable(err));
    QCOMPARE(c.windowSize, QSize(640, 480));
    QCOMPARE(c.histogramBins, 32);
    QCOMPARE(c.isolineInitial, -1.5);
    QVERIFY(!c.watchEnabled);
    QVERIFY(!c.keepPinnedLevelsOnReload);
    QCOMPARE(c.logDir, QString("/tmp/logs"));
}

void TestViewerConfig::positionalPath() {
    ViewerConfig c;
    c.imagePath = "default.ppm";
    QVERIFY(ViewerConfig::applyArguments(c, {"imview"}));
    QCOMPARE(c.imagePath, QString("default.ppm"));
    QVERIFY(ViewerConfig::applyArguments(c, {"imview", "frames/step_10.ppm"}));
    QCOMPARE(c.imagePath, QString("frames/step_10.ppm"));
}

void TestViewerConfig::badSize_data() {
    QTest::addColumn<QString>("size");
    QTest::newRow("missing height") << "640x";
    QTest::newRow("zero") << "0x480";
    QTest::newRow("words") << "large";
}

void TestViewerConfig::badSize() {
    QFETCH(QString, size);
    ViewerConfig c;
    QString err;
    QVERIFY(!ViewerConfig::applyArguments(c, {"imview", "--size", size}, &err));
    QVERIFY(err.contains("--size"));
    QCOMPARE(c.windowSize, QSize(800, 450));
}

void TestViewerConfig::unknownOption() {
    ViewerConfig c;
    QString err;
    QVERIFY(!ViewerConfig::applyArguments(c, {"imview", "--frobnicate"}, &err));
    QVERIFY(!err.isEmpty());
}

QTEST_GUILESS_MAIN(TestViewerConfig)
#include "tst_viewerconfig.moc"
