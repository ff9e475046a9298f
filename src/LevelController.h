#ifndef LEVELCONTROLLER_H
#define LEVELCONTROLLER_H

#include <QObject>
#include <QImage>
#include <vector>
#include "ViewerState.h"

/**
 * @brief Per-channel sample counts over a shared value axis
 */
struct HistogramData {
    std::vector<std::vector<int>> bins; // [channel][bin]
    double lo = 0.0;                    // value at the left edge of bin 0
    double hi = 0.0;                    // value at the right edge of the last bin
    int channels = 0;

    bool isEmpty() const { return bins.empty() || bins[0].empty(); }
    int binCount() const { return bins.empty() ? 0 : static_cast<int>(bins[0].size()); }
    double binWidth() const { return binCount() > 0 ? (hi - lo) / binCount() : 0.0; }
};

/**
 * @brief Histogram, level window and isoline of the viewer
 *
 * Writes the levels and isoline fields of ViewerState. The isoline is a
 * cosmetic marker and never touches the levels or the rendered image.
 *
 * Reload policy: levels are recomputed from data after every reload unless
 * the user pinned them by dragging a level handle (and keepPinnedOnReload is
 * set). resetLevels() unpins.
 */
class LevelController : public QObject {
    Q_OBJECT
public:
    explicit LevelController(ViewerState& state, QObject* parent = nullptr);

    static HistogramData computeHistogram(const ImageBuffer& buffer, int bins = 256);
    HistogramData computeHistogram(const ImageBuffer& buffer) const { return computeHistogram(buffer, m_binCount); }

    // Data min/max per channel
    static std::vector<LevelRange> defaultLevels(const ImageBuffer& buffer);

    /**
     * @brief clamp((sample - lo) / (hi - lo), 0, 1); 0.5 when hi == lo, 0 for NaN, 0/1 for -inf/+inf
     */
    static float toneMap(float sample, const LevelRange& range);

    /**
     * @brief Tone-map @p buffer into an upright 8-bit image
     *
     * Buffer row 0 (bottom) lands on the last scan line.
     */
    static QImage render(const ImageBuffer& buffer, const std::vector<LevelRange>& levels);
    QImage render(const ImageBuffer& buffer) const { return render(buffer, m_state.levels()); }

    void setBinCount(int bins);
    int binCount() const { return m_binCount; }

    void setKeepPinnedOnReload(bool keep) { m_keepPinnedOnReload = keep; }
    bool keepPinnedOnReload() const { return m_keepPinnedOnReload; }

    // Swaps lo/hi when inverted; ignores NaN/inf (MalformedGeometry)
    void setLevelRange(double lo, double hi);
    void setChannelLevelRange(int channel, double lo, double hi);
    LevelRange levelRange(int channel = 0) const;
    bool levelsPinned() const { return m_state.levelsPinned(); }

    // Unconstrained except NaN, which is ignored
    void setIsolineValue(double v);
    double isolineValue() const { return m_state.isolineValue(); }

    const HistogramData& histogram() const { return m_histogram; }

public slots:
    void onImageReplaced();
    // Level handle dragged in the histogram panel; pins the range
    void onUserLevelDrag(double lo, double hi);
    void onUserIsolineDrag(double v) { setIsolineValue(v); }
    // Back to data-derived levels, unpinned
    void resetLevels();

signals:
    void levelsChanged();
    void isolineChanged(double value);
    void histogramChanged();

private:
    static bool sanitize(double& lo, double& hi);

    ViewerState& m_state;
    HistogramData m_histogram;
    int m_binCount = 256;
    bool m_keepPinnedOnReload = true;
};

#endif // LEVELCONTROLLER_H
