#include "MainWindow.h"
#include "ImageViewer.h"
#include "ImageStore.h"
#include "PixelInspector.h"
#include "LevelController.h"
#include "widgets/HistogramWidget.h"
#include "core/FileWatcher.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include <QAction>
#include <QFileInfo>
#include <QIcon>
#include <QLabel>
#include <QSplitter>
#include <QStatusBar>

MainWindow::MainWindow(const ViewerConfig& config, QWidget* parent)
    : QMainWindow(parent), m_config(config)
{
    m_state.setIsolineValue(config.isolineInitial);

    m_store = new ImageStore(m_state, this);
    m_watcher = new FileWatcher(this);
    m_watcher->setDebounceInterval(config.debounceMs);
    m_watcher->setPollInterval(config.pollMs);
    m_inspector = new PixelInspector(m_state, this);
    m_levels = new LevelController(m_state, this);
    m_levels->setBinCount(config.histogramBins);
    m_levels->setKeepPinnedOnReload(config.keepPinnedLevelsOnReload);

    setupUi();
    setupActions();

    // Pointer -> status line
    connect(m_viewer, &ImageViewer::pointerMoved, m_inspector, &PixelInspector::onPointerMove);
    connect(m_viewer, &ImageViewer::pointerLeft, m_inspector, &PixelInspector::onPointerExit);
    connect(m_inspector, &PixelInspector::statusChanged, this, &MainWindow::updatePixelInfo);

    // File change -> reload, always through the event queue
    connect(m_watcher, &FileWatcher::fileChanged, m_store, &ImageStore::onFileChanged, Qt::QueuedConnection);
    connect(m_store, &ImageStore::imageReplaced, this, &MainWindow::onImageReplaced);
    connect(m_store, &ImageStore::reloadFailed, this, &MainWindow::onReloadFailed);

    // Levels <-> panel
    connect(m_levels, &LevelController::levelsChanged, this, &MainWindow::onLevelsChanged);
    connect(m_levels, &LevelController::histogramChanged, this, [this]() {
        m_levelPanel->setHistogram(m_levels->histogram());
    });
    connect(m_levels, &LevelController::isolineChanged, m_levelPanel, &HistogramWidget::setIsolineValue);
    connect(m_levelPanel, &HistogramWidget::levelsDragged, m_levels, &LevelController::onUserLevelDrag);
    connect(m_levelPanel, &HistogramWidget::isolineDragged, m_levels, &LevelController::onUserIsolineDrag);
    connect(m_levelPanel, &HistogramWidget::resetRequested, m_levels, &LevelController::resetLevels);

    m_levelPanel->setIsolineValue(m_state.isolineValue());
}

MainWindow::~MainWindow() {
    m_watcher->stop();
}

void MainWindow::setupUi() {
    setWindowTitle(m_config.windowTitle);
    if (!m_config.iconPath.isEmpty() && QFileInfo::exists(m_config.iconPath)) {
        setWindowIcon(QIcon(m_config.iconPath));
    }
    resize(m_config.windowSize);

    m_viewer = new ImageViewer(this);
    m_levelPanel = new HistogramWidget(this);

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_splitter->addWidget(m_viewer);
    m_splitter->addWidget(m_levelPanel);
    m_splitter->setStretchFactor(0, 1);
    m_splitter->setStretchFactor(1, 0);
    m_splitter->setCollapsible(0, false);
    setCentralWidget(m_splitter);

    statusBar()->setSizeGripEnabled(true);
    statusBar()->setStyleSheet(
        "QStatusBar { background: #1a1a1a; color: #aaa; border-top: 1px solid #333; padding: 2px; }"
    );

    // Pixel Info Label (Left of Status Bar)
    m_pixelInfoLabel = new QLabel(this);
    m_pixelInfoLabel->setStyleSheet("color: #ccc; font-family: monospace; padding-left: 10px;");
    m_pixelInfoLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    statusBar()->addWidget(m_pixelInfoLabel, 1);
}

void MainWindow::setupActions() {
    auto addShortcut = [this](const QString& text, const QKeySequence& key, auto slot) {
        QAction* action = new QAction(text, this);
        action->setShortcut(key);
        action->setShortcutContext(Qt::WindowShortcut);
        connect(action, &QAction::triggered, this, slot);
        addAction(action);
        return action;
    };

    addShortcut(tr("Fit to Window"), QKeySequence(Qt::Key_F), [this]() { m_viewer->fitToWindow(); });
    addShortcut(tr("Zoom 1:1"), QKeySequence(Qt::Key_1), [this]() { m_viewer->zoom1to1(); });
    addShortcut(tr("Zoom In"), QKeySequence(QKeySequence::ZoomIn), [this]() { m_viewer->zoomIn(); });
    addShortcut(tr("Zoom Out"), QKeySequence(QKeySequence::ZoomOut), [this]() { m_viewer->zoomOut(); });
    addShortcut(tr("Auto Levels"), QKeySequence(Qt::Key_A), [this]() { autoLevels(); });
    addShortcut(tr("Log Histogram"), QKeySequence(Qt::Key_L), [this]() {
        m_logHistogram = !m_logHistogram;
        m_levelPanel->setLogScale(m_logHistogram);
    });
}

bool MainWindow::openImage(const QString& path, QString* errorMsg) {
    Result<ViewerState::BufferPtr> loaded = m_store->load(path);
    if (!loaded) {
        const QString msg = reportError(loaded.kind(), loaded.error());
        if (errorMsg) *errorMsg = msg;
        return false;
    }

    if (!m_config.watchEnabled) {
        Logger::info("File watching disabled, showing a static image", "MainWindow");
        return true;
    }

    QString watchErr;
    if (!m_watcher->watch(path, &watchErr)) {
        const QString msg = reportError(ErrorKind::WatchError, watchErr);
        statusBar()->showMessage(msg, 5000);
    }
    return true;
}

QString MainWindow::pixelInfo() const {
    return m_pixelInfoLabel->text();
}

void MainWindow::autoLevels() {
    m_levels->resetLevels();
}

void MainWindow::onImageReplaced(bool geometryChanged) {
    // Levels first so the first frame of the new image uses its own window
    m_replacing = true;
    m_levels->onImageReplaced();
    m_replacing = false;
    redraw(!geometryChanged);
    m_inspector->refresh();
}

void MainWindow::onLevelsChanged() {
    m_levelPanel->setLevels(m_state.levels());
    if (!m_replacing) redraw(true);
}

void MainWindow::onReloadFailed(const QString& message) {
    statusBar()->showMessage(message, 5000);
}

void MainWindow::updatePixelInfo(const QString& info) {
    if (m_pixelInfoLabel) {
        m_pixelInfoLabel->setText(info);
    }
}

void MainWindow::redraw(bool preserveView) {
    const ViewerState::BufferPtr buffer = m_state.currentImage();
    if (!buffer) return;
    m_viewer->setImage(m_levels->render(*buffer), preserveView);
}
