#include "ImageViewer.h"
#include <QWheelEvent>
#include <QMouseEvent>
#include <QScrollBar>

ImageViewer::ImageViewer(QWidget* parent) : QGraphicsView(parent) {
    m_scene = new QGraphicsScene(this);
    setScene(m_scene);

    m_imageItem = new QGraphicsPixmapItem();
    m_imageItem->setTransformationMode(Qt::FastTransformation); // Keep pixels crisp when zoomed
    m_scene->addItem(m_imageItem);

    setDragMode(QGraphicsView::ScrollHandDrag);
    setBackgroundBrush(QBrush(QColor(30, 30, 30)));
    setFrameShape(QFrame::NoFrame);
    setAlignment(Qt::AlignCenter);

    // Zoom at Mouse Cursor
    setTransformationAnchor(QGraphicsView::AnchorUnderMouse);
    setResizeAnchor(QGraphicsView::AnchorViewCenter);

    setMouseTracking(true);
    viewport()->setMouseTracking(true);
}

void ImageViewer::setImage(const QImage& image, bool preserveView) {
    m_displayImage = image;
    m_imageItem->setPixmap(QPixmap::fromImage(image));
    m_scene->setSceneRect(image.rect());

    if (!preserveView) {
        fitToWindow();
    } else {
        m_scaleFactor = transform().m11();
    }
}

QPointF ImageViewer::sceneToDisplay(const QPointF& scenePos) const {
    return QPointF(scenePos.x(), m_displayImage.height() - scenePos.y());
}

QPointF ImageViewer::displayToScene(const QPointF& displayPos) const {
    return QPointF(displayPos.x(), m_displayImage.height() - displayPos.y());
}

void ImageViewer::updatePointer(const QPoint& viewPos) {
    const QPointF scenePos = mapToScene(viewPos);
    const bool inside = !m_displayImage.isNull() && m_imageItem->boundingRect().contains(scenePos);

    if (inside) {
        m_pointerInside = true;
        emit pointerMoved(sceneToDisplay(scenePos));
    } else if (m_pointerInside) {
        m_pointerInside = false;
        emit pointerLeft();
    }
}

void ImageViewer::mouseMoveEvent(QMouseEvent* event) {
    QGraphicsView::mouseMoveEvent(event);
    updatePointer(event->pos());
}

void ImageViewer::leaveEvent(QEvent* event) {
    QGraphicsView::leaveEvent(event);
    if (m_pointerInside) {
        m_pointerInside = false;
        emit pointerLeft();
    }
}

void ImageViewer::zoomIn() {
    scale(1.25, 1.25);
    m_scaleFactor = transform().m11();
}

void ImageViewer::zoomOut() {
    scale(0.8, 0.8);
    m_scaleFactor = transform().m11();
}

void ImageViewer::fitToWindow() {
    if (!m_imageItem->pixmap().isNull()) {
        fitInView(m_imageItem, Qt::KeepAspectRatio);
        m_scaleFactor = transform().m11();
    }
}

void ImageViewer::zoom1to1() {
    setTransform(QTransform()); // Reset to identity (scale 1.0)
    m_scaleFactor = 1.0;
}

void ImageViewer::wheelEvent(QWheelEvent* event) {
    if (event->angleDelta().y() > 0) {
        zoomIn();
    } else {
        zoomOut();
    }
    event->accept();
    // The pixel under a fixed cursor changes with the zoom
    updatePointer(event->position().toPoint());
}
