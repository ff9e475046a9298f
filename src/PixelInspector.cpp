#include "PixelInspector.h"
#include <QStringList>

PixelInspector::PixelInspector(const ViewerState& state, QObject* parent)
    : QObject(parent), m_state(state)
{
}

QString PixelInspector::formatStatus(const QPointF& displayPos, const PixelIndex& index, const Sample& sample) {
    QString value;
    if (const auto* s = std::get_if<ScalarSample>(&sample)) {
        value = QString::asprintf("%.3g", s->value);
    } else {
        const auto& v = std::get<VectorSample>(sample);
        QStringList parts;
        for (int c = 0; c < v.count; ++c) parts << QString::asprintf("%.3g", v.values[c]);
        value = "[" + parts.join(' ') + "]";
    }

    return QString::asprintf("pos: (%0.1f, %0.1f)  pixel: (%d, %d)  value: ",
                             displayPos.x(), displayPos.y(), index.row, index.col) + value;
}

void PixelInspector::onPointerMove(const QPointF& displayPos) {
    m_lastPos = displayPos;
    m_overImage = true;

    const ViewerState::BufferPtr buffer = m_state.currentImage();
    if (!buffer || !buffer->isValid()) {
        setStatus(QString());
        return;
    }

    const PixelIndex idx = CoordinateMapper::mapToPixel(displayPos, {buffer->height(), buffer->width()});
    setStatus(formatStatus(displayPos, idx, buffer->sampleAt(idx.row, idx.col)));
}

void PixelInspector::onPointerExit() {
    m_overImage = false;
    setStatus(QString());
}

void PixelInspector::refresh() {
    if (m_overImage) onPointerMove(m_lastPos);
}

void PixelInspector::setStatus(const QString& text) {
    if (text == m_status) return;
    m_status = text;
    emit statusChanged(m_status);
}
