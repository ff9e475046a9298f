#ifndef HISTOGRAMWIDGET_H
#define HISTOGRAMWIDGET_H

#include <QWidget>
#include <vector>
#include "LevelController.h"

/**
 * @brief Level panel: vertical value axis, histogram, level handles and isoline
 *
 * Values grow upward. The level window is the shaded band between two
 * draggable handles; the isoline is a green horizontal line drawn above the
 * handles and dragged independently. The widget only reports drags; the
 * LevelController owns the values and pushes them back with setLevels() and
 * setIsolineValue().
 */
class HistogramWidget : public QWidget {
    Q_OBJECT
public:
    explicit HistogramWidget(QWidget *parent = nullptr);

    void setHistogram(const HistogramData& data);
    void setLevels(const std::vector<LevelRange>& levels);
    void setIsolineValue(double value);
    void setLogScale(bool enabled);
    void clear();

    double valueAt(int y) const;
    int yForValue(double value) const;

    QSize sizeHint() const override { return QSize(160, 300); }

signals:
    void levelsDragged(double lo, double hi);
    void isolineDragged(double value);
    void resetRequested();

protected:
    void paintEvent(class QPaintEvent *event) override;
    void resizeEvent(class QResizeEvent *event) override;
    void mousePressEvent(class QMouseEvent *event) override;
    void mouseMoveEvent(class QMouseEvent *event) override;
    void mouseReleaseEvent(class QMouseEvent *event) override;
    void mouseDoubleClickEvent(class QMouseEvent *event) override;
    void leaveEvent(class QEvent *event) override;

private:
    enum DragTarget { Drag_None, Drag_Isoline, Drag_Lo, Drag_Hi, Drag_Region };

    DragTarget hitTest(int y) const;
    void updateViewRange();
    void updateResampledBins();

    HistogramData m_data;
    std::vector<std::vector<float>> m_resampledBins; // [channel][pixel row from top]
    double m_maxVal = 0.0;
    int m_lastH = -1;
    bool m_logScale = false;

    double m_lo = 0.0;
    double m_hi = 1.0;
    double m_isoline = 0.8;
    bool m_hasLevels = false;

    double m_viewLo = 0.0;
    double m_viewHi = 1.0;

    DragTarget m_drag = Drag_None;
    DragTarget m_hover = Drag_None;
    double m_dragAnchor = 0.0; // value under the cursor at press, region drags
};

#endif // HISTOGRAMWIDGET_H
