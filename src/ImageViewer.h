#ifndef IMAGEVIEWER_H
#define IMAGEVIEWER_H

#include <QGraphicsView>
#include <QGraphicsScene>
#include <QGraphicsPixmapItem>
#include <QImage>

/**
 * @brief Zoomable view of the tone-mapped image
 *
 * Pointer positions are reported in display space: x to the right, y upward,
 * (0,0) at the bottom-left corner of the image, one unit per pixel.
 */
class ImageViewer : public QGraphicsView {
    Q_OBJECT
public:
    explicit ImageViewer(QWidget* parent = nullptr);
    virtual ~ImageViewer() = default;

    void setImage(const QImage& image, bool preserveView = false);
    QImage getCurrentDisplayImage() const { return m_displayImage; }

    void zoomIn();
    void zoomOut();
    void zoom1to1();
    void fitToWindow();
    double zoomFactor() const { return m_scaleFactor; }

    // Scene (y down, origin top-left) to display space and back
    QPointF sceneToDisplay(const QPointF& scenePos) const;
    QPointF displayToScene(const QPointF& displayPos) const;

signals:
    void pointerMoved(const QPointF& displayPos);
    void pointerLeft();

protected:
    void mouseMoveEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    void updatePointer(const QPoint& viewPos);

    QGraphicsScene* m_scene;
    QGraphicsPixmapItem* m_imageItem;
    QImage m_displayImage;
    double m_scaleFactor = 1.0;
    bool m_pointerInside = false;
};

#endif // IMAGEVIEWER_H
