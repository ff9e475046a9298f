#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include "ViewerState.h"
#include "core/ViewerConfig.h"

class QLabel;
class QSplitter;
class ImageViewer;
class HistogramWidget;
class ImageStore;
class FileWatcher;
class PixelInspector;
class LevelController;

/**
 * @brief Top-level window: image view, level panel and pixel status line
 *
 * Owns the viewer state and every component that reads or writes it. All
 * file-change handling runs on the GUI event loop; the watcher only posts.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const ViewerConfig& config, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Load @p path and, when enabled, start watching it
     * @return false when the first decode fails; a watch failure only degrades to a static view
     */
    bool openImage(const QString& path, QString* errorMsg = nullptr);

    ImageViewer* viewer() const { return m_viewer; }
    HistogramWidget* levelPanel() const { return m_levelPanel; }
    ImageStore* store() const { return m_store; }
    FileWatcher* watcher() const { return m_watcher; }
    PixelInspector* inspector() const { return m_inspector; }
    LevelController* levels() const { return m_levels; }
    const ViewerState& state() const { return m_state; }

    QString pixelInfo() const;

public slots:
    void autoLevels();

private slots:
    void onImageReplaced(bool geometryChanged);
    void onLevelsChanged();
    void onReloadFailed(const QString& message);
    void updatePixelInfo(const QString& info);

private:
    void setupUi();
    void setupActions();
    void redraw(bool preserveView);

    ViewerConfig m_config;
    ViewerState m_state;

    ImageStore* m_store = nullptr;
    FileWatcher* m_watcher = nullptr;
    PixelInspector* m_inspector = nullptr;
    LevelController* m_levels = nullptr;

    QSplitter* m_splitter = nullptr;
    ImageViewer* m_viewer = nullptr;
    HistogramWidget* m_levelPanel = nullptr;
    QLabel* m_pixelInfoLabel = nullptr;
    bool m_logHistogram = false;
    bool m_replacing = false;
};

#endif // MAINWINDOW_H
