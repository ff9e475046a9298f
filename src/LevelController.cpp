#include "LevelController.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

LevelController::LevelController(ViewerState& state, QObject* parent)
    : QObject(parent), m_state(state)
{
}

HistogramData LevelController::computeHistogram(const ImageBuffer& buffer, int bins) {
    HistogramData out;
    if (!buffer.isValid() || bins <= 0) return out;

    const int channels = buffer.channels();
    double lo = buffer.channelMin(0);
    double hi = buffer.channelMax(0);
    for (int c = 1; c < channels; ++c) {
        lo = std::min(lo, static_cast<double>(buffer.channelMin(c)));
        hi = std::max(hi, static_cast<double>(buffer.channelMax(c)));
    }
    if (hi <= lo) {
        // Flat image: one bin centered on the value
        lo -= 0.5;
        hi += 0.5;
    }

    out.lo = lo;
    out.hi = hi;
    out.channels = channels;

    int numThreads = 1;
#ifdef _OPENMP
    numThreads = std::max(1, omp_get_max_threads());
#endif

    std::vector<std::vector<std::vector<int>>> localHists(numThreads,
        std::vector<std::vector<int>>(channels, std::vector<int>(bins, 0)));

    const std::vector<float>& data = buffer.data();
    const double scale = bins / (hi - lo);

    #pragma omp parallel
    {
        int tid = 0;
#ifdef _OPENMP
        tid = omp_get_thread_num();
#endif
        #pragma omp for
        for (long long i = 0; i < (long long)data.size(); ++i) {
            const float v = data[i];
            if (!std::isfinite(v)) continue;
            const int c = static_cast<int>(i % channels);
            int b = static_cast<int>((v - lo) * scale);
            if (b < 0) b = 0;
            else if (b >= bins) b = bins - 1;
            localHists[tid][c][b]++;
        }
    }

    out.bins.assign(channels, std::vector<int>(bins, 0));
    for (int t = 0; t < numThreads; ++t) {
        for (int c = 0; c < channels; ++c) {
            for (int b = 0; b < bins; ++b) {
                out.bins[c][b] += localHists[t][c][b];
            }
        }
    }
    return out;
}

std::vector<LevelRange> LevelController::defaultLevels(const ImageBuffer& buffer) {
    std::vector<LevelRange> levels;
    if (!buffer.isValid()) return levels;
    levels.reserve(buffer.channels());
    for (int c = 0; c < buffer.channels(); ++c) {
        levels.push_back({buffer.channelMin(c), buffer.channelMax(c)});
    }
    return levels;
}

float LevelController::toneMap(float sample, const LevelRange& range) {
    if (std::isnan(sample)) return 0.0f;
    const double span = range.hi - range.lo;
    if (span == 0.0) return 0.5f;
    if (std::isinf(sample)) return sample > 0 ? 1.0f : 0.0f;
    const double t = (static_cast<double>(sample) - range.lo) / span;
    // Non-finite t is only reachable through a non-finite window
    if (std::isnan(t)) return 0.0f;
    return static_cast<float>(std::clamp(t, 0.0, 1.0));
}

QImage LevelController::render(const ImageBuffer& buffer, const std::vector<LevelRange>& levels) {
    if (!buffer.isValid()) return QImage();

    const int w = buffer.width();
    const int h = buffer.height();
    const int ch = buffer.channels();

    QImage::Format fmt = QImage::Format_RGB888;
    if (ch == 1) fmt = QImage::Format_Grayscale8;
    else if (ch == 4) fmt = QImage::Format_RGBA8888;

    QImage img(w, h, fmt);
    if (img.isNull()) return img;

    // Missing entries fall back to the data range of that channel
    std::vector<LevelRange> ranges = defaultLevels(buffer);
    for (int c = 0; c < ch && c < static_cast<int>(levels.size()); ++c) ranges[c] = levels[c];

    const std::vector<float>& data = buffer.data();

    #pragma omp parallel for
    for (int y = 0; y < h; ++y) {
        uchar* line = img.scanLine(h - 1 - y);
        const float* row = data.data() + static_cast<size_t>(y) * w * ch;
        for (int x = 0; x < w * ch; ++x) {
            const float v = toneMap(row[x], ranges[x % ch]);
            line[x] = static_cast<uchar>(std::lround(v * 255.0f));
        }
    }
    return img;
}

void LevelController::setBinCount(int bins) {
    bins = std::clamp(bins, 1, 65536);
    if (bins == m_binCount) return;
    m_binCount = bins;
    if (const auto buffer = m_state.currentImage()) {
        m_histogram = computeHistogram(*buffer);
        emit histogramChanged();
    }
}

bool LevelController::sanitize(double& lo, double& hi) {
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        reportError(ErrorKind::MalformedGeometry,
                    QString("Ignoring level range (%1, %2)").arg(lo).arg(hi));
        return false;
    }
    if (lo > hi) std::swap(lo, hi);
    return true;
}

void LevelController::setLevelRange(double lo, double hi) {
    if (!sanitize(lo, hi)) return;

    std::vector<LevelRange>& levels = m_state.levels();
    const auto buffer = m_state.currentImage();
    const size_t n = buffer ? static_cast<size_t>(buffer->channels()) : std::max<size_t>(1, levels.size());
    levels.assign(n, {lo, hi});
    emit levelsChanged();
}

void LevelController::setChannelLevelRange(int channel, double lo, double hi) {
    if (!sanitize(lo, hi)) return;

    std::vector<LevelRange>& levels = m_state.levels();
    if (channel < 0) return;
    if (channel >= static_cast<int>(levels.size())) {
        const auto buffer = m_state.currentImage();
        if (!buffer || channel >= buffer->channels()) return;
        std::vector<LevelRange> defaults = defaultLevels(*buffer);
        for (size_t c = levels.size(); c < defaults.size(); ++c) levels.push_back(defaults[c]);
    }
    levels[channel] = {lo, hi};
    emit levelsChanged();
}

LevelRange LevelController::levelRange(int channel) const {
    const std::vector<LevelRange>& levels = m_state.levels();
    if (channel < 0 || channel >= static_cast<int>(levels.size())) return LevelRange();
    return levels[channel];
}

void LevelController::setIsolineValue(double v) {
    if (std::isnan(v)) {
        reportError(ErrorKind::MalformedGeometry, "Ignoring NaN isoline value");
        return;
    }
    if (v == m_state.isolineValue()) return;
    m_state.setIsolineValue(v);
    emit isolineChanged(v);
}

void LevelController::onImageReplaced() {
    const auto buffer = m_state.currentImage();
    if (!buffer) return;

    m_histogram = computeHistogram(*buffer);
    emit histogramChanged();

    const bool channelsMatch = static_cast<int>(m_state.levels().size()) == buffer->channels();
    if (m_state.levelsPinned() && m_keepPinnedOnReload && channelsMatch) {
        Logger::debug("Keeping pinned level range", "Levels");
        return;
    }

    m_state.setLevelsPinned(false);
    m_state.levels() = defaultLevels(*buffer);
    emit levelsChanged();
}

void LevelController::onUserLevelDrag(double lo, double hi) {
    if (!sanitize(lo, hi)) return;
    m_state.setLevelsPinned(true);
    setLevelRange(lo, hi);
}

void LevelController::resetLevels() {
    m_state.setLevelsPinned(false);
    const auto buffer = m_state.currentImage();
    if (!buffer) return;
    m_state.levels() = defaultLevels(*buffer);
    emit levelsChanged();
}
