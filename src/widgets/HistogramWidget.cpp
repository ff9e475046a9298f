#include "HistogramWidget.h"
#include <QPainter>
#include <QPainterPath>
#include <QMouseEvent>
#include <QResizeEvent>
#include <cmath>
#include <algorithm>

namespace {
constexpr int kMarginV = 8;
constexpr int kGrabDistance = 5;
}

HistogramWidget::HistogramWidget(QWidget *parent) : QWidget(parent) {
    setBackgroundRole(QPalette::Base);
    setAutoFillBackground(true);
    setMinimumWidth(120);
    setMouseTracking(true); // For hover cursor
}

void HistogramWidget::setHistogram(const HistogramData& data) {
    m_data = data;
    updateViewRange();
    updateResampledBins();
    update();
}

void HistogramWidget::setLevels(const std::vector<LevelRange>& levels) {
    if (levels.empty()) {
        m_hasLevels = false;
        update();
        return;
    }
    // Envelope of the per-channel windows
    double lo = levels[0].lo;
    double hi = levels[0].hi;
    for (const LevelRange& r : levels) {
        lo = std::min(lo, r.lo);
        hi = std::max(hi, r.hi);
    }

    // A handle dragged across the other comes back swapped; the grabbed
    // handle follows its value so the stationary one stays put
    const bool crossed = (m_drag == Drag_Lo || m_drag == Drag_Hi) && m_lo > m_hi && lo == m_hi && hi == m_lo;
    if (crossed) m_drag = (m_drag == Drag_Lo) ? Drag_Hi : Drag_Lo;

    m_lo = lo;
    m_hi = hi;
    m_hasLevels = true;
    if (m_drag == Drag_None) updateViewRange();
    update();
}

void HistogramWidget::setIsolineValue(double value) {
    m_isoline = value;
    if (m_drag == Drag_None) updateViewRange();
    update();
}

void HistogramWidget::setLogScale(bool enabled) {
    if (m_logScale == enabled) return;
    m_logScale = enabled;
    updateResampledBins();
    update();
}

void HistogramWidget::clear() {
    m_data = HistogramData();
    m_resampledBins.clear();
    m_maxVal = 0.0;
    m_hasLevels = false;
    update();
}

void HistogramWidget::updateViewRange() {
    double lo = m_data.isEmpty() ? 0.0 : m_data.lo;
    double hi = m_data.isEmpty() ? 1.0 : m_data.hi;
    if (m_hasLevels) {
        lo = std::min(lo, m_lo);
        hi = std::max(hi, m_hi);
    }
    if (std::isfinite(m_isoline)) {
        lo = std::min(lo, m_isoline);
        hi = std::max(hi, m_isoline);
    }
    if (hi <= lo) hi = lo + 1.0;

    const double pad = (hi - lo) * 0.02;
    if (lo - pad != m_viewLo || hi + pad != m_viewHi) {
        m_viewLo = lo - pad;
        m_viewHi = hi + pad;
        updateResampledBins();
    }
}

double HistogramWidget::valueAt(int y) const {
    const int span = std::max(1, height() - 2 * kMarginV);
    const double t = 1.0 - static_cast<double>(y - kMarginV) / span;
    return m_viewLo + t * (m_viewHi - m_viewLo);
}

int HistogramWidget::yForValue(double value) const {
    const int span = std::max(1, height() - 2 * kMarginV);
    const double t = (value - m_viewLo) / (m_viewHi - m_viewLo);
    return kMarginV + static_cast<int>(std::lround((1.0 - t) * span));
}

void HistogramWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    updateResampledBins();
}

void HistogramWidget::updateResampledBins() {
    const int h = height() - 2 * kMarginV;
    m_resampledBins.clear();
    m_maxVal = 0.0;
    if (h <= 0 || m_data.isEmpty()) return;
    m_lastH = height();

    // Sum source bins into one row per pixel of the value axis
    const int numBins = m_data.binCount();
    const double binW = m_data.binWidth();
    m_resampledBins.assign(m_data.channels, std::vector<float>(h, 0.0f));

    for (int c = 0; c < m_data.channels && c < (int)m_data.bins.size(); ++c) {
        for (int b = 0; b < numBins; ++b) {
            const double center = m_data.lo + (b + 0.5) * binW;
            const int row = yForValue(center) - kMarginV;
            if (row < 0 || row >= h) continue;
            m_resampledBins[c][row] += (float)m_data.bins[c][b];
        }
        for (int row = 0; row < h; ++row) {
            float& v = m_resampledBins[c][row];
            if (m_logScale && v > 0) v = std::log1p(v);
            if (v > m_maxVal) m_maxVal = v;
        }
    }
}

HistogramWidget::DragTarget HistogramWidget::hitTest(int y) const {
    if (std::isfinite(m_isoline) && std::abs(y - yForValue(m_isoline)) <= kGrabDistance) return Drag_Isoline;
    if (!m_hasLevels) return Drag_None;

    const int yLo = yForValue(m_lo);
    const int yHi = yForValue(m_hi);
    if (std::abs(y - yHi) <= kGrabDistance) return Drag_Hi;
    if (std::abs(y - yLo) <= kGrabDistance) return Drag_Lo;
    if (y < yLo && y > yHi) return Drag_Region;
    return Drag_None;
}

void HistogramWidget::mousePressEvent(QMouseEvent* event) {
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }
    const int y = static_cast<int>(event->position().y());
    m_drag = hitTest(y);
    m_dragAnchor = valueAt(y);
    update();
}

void HistogramWidget::mouseMoveEvent(QMouseEvent* event) {
    const int y = std::clamp(static_cast<int>(event->position().y()), kMarginV, height() - kMarginV);
    const double v = valueAt(y);

    switch (m_drag) {
    case Drag_Isoline:
        m_isoline = v;
        emit isolineDragged(v);
        break;
    case Drag_Lo:
        // Handles may cross; the controller swaps inverted windows
        m_lo = v;
        emit levelsDragged(m_lo, m_hi);
        break;
    case Drag_Hi:
        m_hi = v;
        emit levelsDragged(m_lo, m_hi);
        break;
    case Drag_Region: {
        const double delta = v - m_dragAnchor;
        m_dragAnchor = v;
        m_lo += delta;
        m_hi += delta;
        emit levelsDragged(m_lo, m_hi);
        break;
    }
    case Drag_None: {
        const DragTarget hover = hitTest(y);
        if (hover != m_hover) {
            m_hover = hover;
            setCursor(hover == Drag_None ? Qt::ArrowCursor : (hover == Drag_Region ? Qt::OpenHandCursor : Qt::SizeVerCursor));
            update();
        }
        return;
    }
    }
    update();
}

void HistogramWidget::mouseReleaseEvent(QMouseEvent* event) {
    Q_UNUSED(event);
    if (m_drag == Drag_None) return;
    m_drag = Drag_None;
    updateViewRange();
    update();
}

void HistogramWidget::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) emit resetRequested();
}

void HistogramWidget::leaveEvent(QEvent* event) {
    QWidget::leaveEvent(event);
    if (m_hover != Drag_None) {
        m_hover = Drag_None;
        unsetCursor();
        update();
    }
}

void HistogramWidget::paintEvent(QPaintEvent *) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    const int w = width();
    const int h = height();

    if (h != m_lastH) updateResampledBins();

    painter.fillRect(rect(), QColor(20, 20, 20));

    // Grid
    painter.setPen(QPen(QColor(60, 60, 60), 1));
    for (float t = 0.25f; t < 1.0f; t += 0.25f) {
        const int py = kMarginV + static_cast<int>(t * (h - 2 * kMarginV));
        painter.drawLine(0, py, w, py);
    }

    // Level band
    if (m_hasLevels) {
        const int yLo = yForValue(m_lo);
        const int yHi = yForValue(m_hi);
        painter.fillRect(QRect(QPoint(0, std::min(yLo, yHi)), QPoint(w, std::max(yLo, yHi))), QColor(0, 0, 255, 40));
    }

    // Histogram, bars grow to the right
    if (!m_resampledBins.empty() && m_maxVal > 0) {
        QColor colors[4] = { QColor(255, 80, 80), QColor(80, 255, 80), QColor(80, 80, 255), QColor(200, 200, 200) };
        if (m_data.channels == 1) colors[0] = Qt::white;
        painter.setCompositionMode(QPainter::CompositionMode_Screen);

        const int usableW = w - 4;
        for (int c = 0; c < (int)m_resampledBins.size(); ++c) {
            QPainterPath path;
            path.moveTo(0, kMarginV);
            for (int row = 0; row < (int)m_resampledBins[c].size(); ++row) {
                const double normW = m_resampledBins[c][row] / m_maxVal;
                path.lineTo(normW * usableW, kMarginV + row);
            }
            path.lineTo(0, h - kMarginV);
            path.closeSubpath();

            QColor col = colors[c % 4];
            col.setAlpha(60);
            painter.setBrush(col);
            painter.setPen(Qt::NoPen);
            painter.drawPath(path);

            col.setAlpha(200);
            painter.setPen(QPen(col, 1.2));
            painter.setBrush(Qt::NoBrush);
            painter.drawPath(path);
        }
        painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    }

    // Level handles
    if (m_hasLevels) {
        auto handlePen = [this](DragTarget t) {
            const bool active = m_drag == t || m_hover == t;
            return QPen(active ? QColor(255, 255, 0) : QColor(180, 180, 255), active ? 2.5 : 1.5);
        };
        painter.setPen(handlePen(Drag_Lo));
        painter.drawLine(0, yForValue(m_lo), w, yForValue(m_lo));
        painter.setPen(handlePen(Drag_Hi));
        painter.drawLine(0, yForValue(m_hi), w, yForValue(m_hi));
    }

    // Isoline on top of the level controls
    if (std::isfinite(m_isoline)) {
        const bool active = m_drag == Drag_Isoline || m_hover == Drag_Isoline;
        const int y = yForValue(m_isoline);
        painter.setPen(QPen(QColor(0, 255, 0), active ? 2.5 : 1.5));
        painter.drawLine(0, y, w, y);
    }

    // Axis labels
    painter.setPen(QColor(160, 160, 160));
    painter.drawText(QRect(0, 0, w - 4, kMarginV + 12), Qt::AlignRight | Qt::AlignTop, QString::number(m_viewHi, 'g', 4));
    painter.drawText(QRect(0, h - kMarginV - 12, w - 4, kMarginV + 12), Qt::AlignRight | Qt::AlignBottom, QString::number(m_viewLo, 'g', 4));
}
