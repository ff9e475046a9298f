#include <QtTest>
#include <cmath>
#include <limits>
#include "LevelController.h"

namespace {

ViewerState::BufferPtr makeBuffer(int w, int h, int ch, std::vector<float> data) {
    return std::make_shared<const ImageBuffer>(w, h, ch, std::move(data));
}

} // namespace

class TestLevelController : public QObject {
    Q_OBJECT
private slots:
    void toneMapClamps();
    void toneMapDegenerateRange();
    void toneMapNan();
    void toneMapInfinity();
    void infiniteSamplesKeepFiniteDefaults();
    void defaultLevelsPerChannel();
    void setLevelRangeSwapsInverted();
    void setLevelRangeIgnoresNonFinite();
    void degenerateRangeRendersMidGray();
    void isolineIndependentOfLevels();
    void isolineIgnoresNan();
    void histogramCounts();
    void histogramFlatImage();
    void histogramSkipsNan();
    void renderFlipsRows();
    void renderRgb();
    void reloadRecomputesUnpinnedLevels();
    void reloadKeepsPinnedLevels();
    void reloadResetsWhenPinningDisabled();
    void resetLevelsUnpins();
};

void TestLevelController::toneMapClamps() {
    const LevelRange r{10.0, 20.0};
    QCOMPARE(LevelController::toneMap(10.0f, r), 0.0f);
    QCOMPARE(LevelController::toneMap(15.0f, r), 0.5f);
    QCOMPARE(LevelController::toneMap(20.0f, r), 1.0f);
    QCOMPARE(LevelController::toneMap(-100.0f, r), 0.0f);
    QCOMPARE(LevelController::toneMap(1e9f, r), 1.0f);
}

void TestLevelController::toneMapDegenerateRange() {
    const LevelRange r{5.0, 5.0};
    QCOMPARE(LevelController::toneMap(0.0f, r), 0.5f);
    QCOMPARE(LevelController::toneMap(5.0f, r), 0.5f);
    QCOMPARE(LevelController::toneMap(1000.0f, r), 0.5f);
}

void TestLevelController::toneMapNan() {
    QCOMPARE(LevelController::toneMap(std::numeric_limits<float>::quiet_NaN(), LevelRange{0, 1}), 0.0f);
}

void TestLevelController::toneMapInfinity() {
    const float inf = std::numeric_limits<float>::infinity();
    QCOMPARE(LevelController::toneMap(inf, LevelRange{0, 1}), 1.0f);
    QCOMPARE(LevelController::toneMap(-inf, LevelRange{0, 1}), 0.0f);
    QCOMPARE(LevelController::toneMap(inf, LevelRange{3, 3}), 0.5f);
}

void TestLevelController::infiniteSamplesKeepFiniteDefaults() {
    // Float files (TIFF, PFM, EXR) may carry +-inf
    const float inf = std::numeric_limits<float>::infinity();
    const ImageBuffer buf(4, 1, 1, {2, inf, 6, -inf});

    const std::vector<LevelRange> levels = LevelController::defaultLevels(buf);
    QCOMPARE(levels[0].lo, 2.0);
    QCOMPARE(levels[0].hi, 6.0);

    const HistogramData h = LevelController::computeHistogram(buf, 4);
    QVERIFY(std::isfinite(h.lo) && std::isfinite(h.hi));
    int total = 0;
    for (int b : h.bins[0]) total += b;
    QCOMPARE(total, 2);

    // Finite samples keep their contrast; infinities saturate
    const QImage img = LevelController::render(buf, levels);
    QCOMPARE(int(img.constScanLine(0)[0]), 0);
    QCOMPARE(int(img.constScanLine(0)[1]), 255);
    QCOMPARE(int(img.constScanLine(0)[2]), 255);
    QCOMPARE(int(img.constScanLine(0)[3]), 0);
}

void TestLevelController::defaultLevelsPerChannel() {
    const ImageBuffer buf(2, 1, 3, {1, 50, 7, 3, 20, 9});
    const std::vector<LevelRange> levels = LevelController::defaultLevels(buf);
    QCOMPARE(levels.size(), size_t(3));
    QCOMPARE(levels[0].lo, 1.0);
    QCOMPARE(levels[0].hi, 3.0);
    QCOMPARE(levels[1].lo, 20.0);
    QCOMPARE(levels[1].hi, 50.0);
    QCOMPARE(levels[2].lo, 7.0);
    QCOMPARE(levels[2].hi, 9.0);
}

void TestLevelController::setLevelRangeSwapsInverted() {
    ViewerState state;
    state.publishImage(makeBuffer(1, 1, 1, {0}));
    LevelController levels(state);
    QSignalSpy spy(&levels, &LevelController::levelsChanged);

    levels.setLevelRange(9.0, 3.0);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(levels.levelRange().lo, 3.0);
    QCOMPARE(levels.levelRange().hi, 9.0);
}

void TestLevelController::setLevelRangeIgnoresNonFinite() {
    ViewerState state;
    state.publishImage(makeBuffer(1, 1, 1, {0}));
    LevelController levels(state);
    levels.setLevelRange(1.0, 2.0);

    QSignalSpy spy(&levels, &LevelController::levelsChanged);
    levels.setLevelRange(std::numeric_limits<double>::quiet_NaN(), 4.0);
    levels.setLevelRange(0.0, std::numeric_limits<double>::infinity());
    QCOMPARE(spy.count(), 0);
    QCOMPARE(levels.levelRange().lo, 1.0);
    QCOMPARE(levels.levelRange().hi, 2.0);
}

void TestLevelController::degenerateRangeRendersMidGray() {
    ViewerState state;
    const auto buffer = makeBuffer(3, 1, 1, {0, 5, 100});
    state.publishImage(buffer);
    LevelController levels(state);
    levels.setLevelRange(5.0, 5.0);

    const QImage img = levels.render(*buffer);
    QCOMPARE(img.format(), QImage::Format_Grayscale8);
    for (int x = 0; x < 3; ++x) QCOMPARE(int(img.constScanLine(0)[x]), 128);
}

void TestLevelController::isolineIndependentOfLevels() {
    ViewerState state;
    const auto buffer = makeBuffer(2, 1, 1, {0, 10});
    state.publishImage(buffer);
    LevelController levels(state);
    levels.onImageReplaced();

    levels.setIsolineValue(4.25);
    const QImage before = levels.render(*buffer);

    for (int i = 0; i < 10; ++i) levels.setLevelRange(i, 20 - i);
    levels.onUserLevelDrag(-3.0, 3.0);
    levels.resetLevels();
    QCOMPARE(levels.isolineValue(), 4.25);

    // And the isoline never changes the rendered pixels
    levels.setIsolineValue(-1000.0);
    QCOMPARE(levels.render(*buffer), before);
}

void TestLevelController::isolineIgnoresNan() {
    ViewerState state;
    LevelController levels(state);
    QSignalSpy spy(&levels, &LevelController::isolineChanged);

    levels.setIsolineValue(2.0);
    levels.setIsolineValue(std::numeric_limits<double>::quiet_NaN());
    levels.setIsolineValue(2.0);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(levels.isolineValue(), 2.0);
}

void TestLevelController::histogramCounts() {
    const ImageBuffer buf(4, 1, 1, {0, 0, 5, 10});
    const HistogramData h = LevelController::computeHistogram(buf, 2);
    QCOMPARE(h.channels, 1);
    QCOMPARE(h.binCount(), 2);
    QCOMPARE(h.lo, 0.0);
    QCOMPARE(h.hi, 10.0);
    QCOMPARE(h.bins[0][0], 2);
    QCOMPARE(h.bins[0][1], 2); // 5 and the top edge
}

void TestLevelController::histogramFlatImage() {
    const ImageBuffer buf(3, 1, 1, {7, 7, 7});
    const HistogramData h = LevelController::computeHistogram(buf, 4);
    QVERIFY(h.hi > h.lo);
    int total = 0;
    for (int b : h.bins[0]) total += b;
    QCOMPARE(total, 3);
}

void TestLevelController::histogramSkipsNan() {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const ImageBuffer buf(3, 1, 1, {nan, 1, 2});
    const HistogramData h = LevelController::computeHistogram(buf, 8);
    int total = 0;
    for (int b : h.bins[0]) total += b;
    QCOMPARE(total, 2);
}

void TestLevelController::renderFlipsRows() {
    // Display orientation: row 0 is the bottom row
    const ImageBuffer buf(1, 2, 1, {0, 255});
    const QImage img = LevelController::render(buf, {LevelRange{0, 255}});
    QCOMPARE(img.size(), QSize(1, 2));
    QCOMPARE(int(img.constScanLine(0)[0]), 255);
    QCOMPARE(int(img.constScanLine(1)[0]), 0);
}

void TestLevelController::renderRgb() {
    const ImageBuffer buf(1, 1, 3, {10, 20, 30});
    const QImage img = LevelController::render(buf, {LevelRange{0, 10}, LevelRange{20, 40}, LevelRange{0, 60}});
    QCOMPARE(img.format(), QImage::Format_RGB888);
    QCOMPARE(img.pixelColor(0, 0), QColor(255, 0, 128));
}

void TestLevelController::reloadRecomputesUnpinnedLevels() {
    ViewerState state;
    LevelController levels(state);
    QSignalSpy hist(&levels, &LevelController::histogramChanged);

    state.publishImage(makeBuffer(2, 1, 1, {0, 10}));
    levels.onImageReplaced();
    QCOMPARE(levels.levelRange().hi, 10.0);

    state.publishImage(makeBuffer(2, 1, 1, {-5, 50}));
    levels.onImageReplaced();
    QCOMPARE(levels.levelRange().lo, -5.0);
    QCOMPARE(levels.levelRange().hi, 50.0);
    QCOMPARE(hist.count(), 2);
}

void TestLevelController::reloadKeepsPinnedLevels() {
    ViewerState state;
    LevelController levels(state);
    state.publishImage(makeBuffer(2, 1, 1, {0, 10}));
    levels.onImageReplaced();

    levels.onUserLevelDrag(2.0, 4.0);
    QVERIFY(levels.levelsPinned());

    state.publishImage(makeBuffer(2, 1, 1, {-5, 50}));
    levels.onImageReplaced();
    QCOMPARE(levels.levelRange().lo, 2.0);
    QCOMPARE(levels.levelRange().hi, 4.0);

    // A different channel count cannot reuse the window
    state.publishImage(makeBuffer(1, 1, 3, {1, 2, 3}));
    levels.onImageReplaced();
    QVERIFY(!levels.levelsPinned());
    QCOMPARE(state.levels().size(), size_t(3));
}

void TestLevelController::reloadResetsWhenPinningDisabled() {
    ViewerState state;
    LevelController levels(state);
    levels.setKeepPinnedOnReload(false);
    state.publishImage(makeBuffer(2, 1, 1, {0, 10}));
    levels.onImageReplaced();
    levels.onUserLevelDrag(2.0, 4.0);

    state.publishImage(makeBuffer(2, 1, 1, {0, 10}));
    levels.onImageReplaced();
    QCOMPARE(levels.levelRange().lo, 0.0);
    QCOMPARE(levels.levelRange().hi, 10.0);
    QVERIFY(!levels.levelsPinned());
}

void TestLevelController::resetLevelsUnpins() {
    ViewerState state;
    LevelController levels(state);
    state.publishImage(makeBuffer(2, 1, 1, {3, 6}));
    levels.onImageReplaced();
    levels.onUserLevelDrag(0.0, 1.0);

    QSignalSpy spy(&levels, &LevelController::levelsChanged);
    levels.resetLevels();
    QCOMPARE(spy.count(), 1);
    QVERIFY(!levels.levelsPinned());
    QCOMPARE(levels.levelRange().lo, 3.0);
    QCOMPARE(levels.levelRange().hi, 6.0);
}

QTEST_MAIN(TestLevelController)
#include "tst_levelcontroller.moc"
