#include <QtTest>
#include "ImageViewer.h"

class TestImageViewer : public QObject {
    Q_OBJECT
private slots:
    void displaySpaceIsYUp();
    void sceneAndDisplayAreInverse();
    void zoomSteps();
    void preserveViewKeepsZoom();
};

void TestImageViewer::displaySpaceIsYUp() {
    ImageViewer viewer;
    viewer.setImage(QImage(4, 3, QImage::Format_Grayscale8));

    // Scene top-left is the display's top-left corner (y = height)
    QCOMPARE(viewer.sceneToDisplay(QPointF(0.0, 0.0)), QPointF(0.0, 3.0));
    QCOMPARE(viewer.sceneToDisplay(QPointF(2.5, 3.0)), QPointF(2.5, 0.0));
    QCOMPARE(viewer.sceneToDisplay(QPointF(1.0, 2.5)), QPointF(1.0, 0.5));
}

void TestImageViewer::sceneAndDisplayAreInverse() {
    ImageViewer viewer;
    viewer.setImage(QImage(7, 5, QImage::Format_RGB888));

    const QPointF display(3.25, 1.75);
    QCOMPARE(viewer.displayToScene(display), QPointF(3.25, 3.25));
    QCOMPARE(viewer.sceneToDisplay(viewer.displayToScene(display)), display);
}

void TestImageViewer::zoomSteps() {
    ImageViewer viewer;
    viewer.setImage(QImage(8, 8, QImage::Format_Grayscale8));
    viewer.zoom1to1();
    QCOMPARE(viewer.zoomFactor(), 1.0);
    viewer.zoomIn();
    QCOMPARE(viewer.zoomFactor(), 1.25);
    viewer.zoomOut();
    QCOMPARE(viewer.zoomFactor(), 1.0);
}

void TestImageViewer::preserveViewKeepsZoom() {
    ImageViewer viewer;
    viewer.setImage(QImage(8, 8, QImage::Format_Grayscale8));
    viewer.zoom1to1();
    viewer.zoomIn();

    viewer.setImage(QImage(8, 8, QImage::Format_Grayscale8), true);
    QCOMPARE(viewer.zoomFactor(), 1.25);
    QCOMPARE(viewer.getCurrentDisplayImage().size(), QSize(8, 8));
}

QTEST_MAIN(TestImageViewer)
#include "tst_imageviewer.moc"
