#ifndef PIXELINSPECTOR_H
#define PIXELINSPECTOR_H

#include <QObject>
#include <QPointF>
#include <QString>
#include "ViewerState.h"
#include "core/CoordinateMapper.h"

/**
 * @brief Status line for the pixel under the cursor
 *
 * Reads a snapshot of the current buffer on every query; never writes state.
 */
class PixelInspector : public QObject {
    Q_OBJECT
public:
    explicit PixelInspector(const ViewerState& state, QObject* parent = nullptr);

    const QString& statusText() const { return m_status; }
    bool isOverImage() const { return m_overImage; }

    // "pos: (x, y)  pixel: (i, j)  value: v" or "... value: [r g b]"
    static QString formatStatus(const QPointF& displayPos, const PixelIndex& index, const Sample& sample);

public slots:
    void onPointerMove(const QPointF& displayPos);
    void onPointerExit();
    // Re-query the last position, e.g. after the image was reloaded
    void refresh();

signals:
    void statusChanged(const QString& text);

private:
    void setStatus(const QString& text);

    const ViewerState& m_state;
    QString m_status;
    QPointF m_lastPos;
    bool m_overImage = false;
};

#endif // PIXELINSPECTOR_H
