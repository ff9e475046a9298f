#ifndef VIEWERSTATE_H
#define VIEWERSTATE_H

#include <QString>
#include <memory>
#include <vector>
#include "ImageBuffer.h"

/**
 * @brief Linear tone-mapping window, lo <= hi
 */
struct LevelRange {
    double lo = 0.0;
    double hi = 1.0;
};

/**
 * @brief Everything the viewer shows, owned by MainWindow and passed by reference
 *
 * Writer discipline:
 * - current image: ImageStore only, by atomic pointer swap (publishImage)
 * - levels and isoline: LevelController only
 * Readers take a snapshot with currentImage(); a published buffer is never
 * modified, so a snapshot stays consistent for as long as it is held.
 */
class ViewerState {
public:
    using BufferPtr = std::shared_ptr<const ImageBuffer>;

    BufferPtr currentImage() const { return std::atomic_load(&m_current); }
    bool hasImage() const { return currentImage() != nullptr; }

    void publishImage(BufferPtr buffer) { std::atomic_store(&m_current, std::move(buffer)); }

    const QString& watchedPath() const { return m_watchedPath; }
    void setWatchedPath(const QString& path) { m_watchedPath = path; }

    // One range per channel of the current image
    const std::vector<LevelRange>& levels() const { return m_levels; }
    std::vector<LevelRange>& levels() { return m_levels; }

    bool levelsPinned() const { return m_levelsPinned; }
    void setLevelsPinned(bool pinned) { m_levelsPinned = pinned; }

    double isolineValue() const { return m_isolineValue; }
    void setIsolineValue(double v) { m_isolineValue = v; }

private:
    BufferPtr m_current;
    QString m_watchedPath;
    std::vector<LevelRange> m_levels;
    bool m_levelsPinned = false;
    double m_isolineValue = 0.8;
};

#endif // VIEWERSTATE_H
