#include "waveview/ui/MainWindow.hpp"

#include <QAction>
#include <QCloseEvent>
#include <QCursor>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QScrollBar>
#include <QSettings>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>
#include <QWidget>

#include "waveview/core/AppContext.hpp"
#include "waveview/data/Point.hpp"
#include "waveview/data/PointRepository.hpp"
#include "waveview/ui/layers/PointsLayer.hpp"
#include "waveview/ui/widgets/WaveformView.hpp"

namespace waveview {
namespace ui {

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>())
{
    QSettings settings;
    m_settings = core::loadViewerSettings(settings);
    setupUi();
    connectPointEvents();
}

MainWindow::~MainWindow()
{
    // The view's points layer is subscribed to the context's bus; tear it
    // down while the context is still alive.
    delete takeCentralWidget();
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    saveSettings();
    QMainWindow::closeEvent(event);
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("WaveView"));
    resize(1100, 360);

    addToolBar(Qt::TopToolBarArea, createToolBar());

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_waveformView = new WaveformView(*m_appContext, m_settings, centralWidget);
    m_scrollBar = new QScrollBar(Qt::Horizontal, centralWidget);
    layout->addWidget(m_waveformView, 1);
    layout->addWidget(m_scrollBar);
    setCentralWidget(centralWidget);

    m_frameLabel = new QLabel(this);
    m_frameLabel->setObjectName(QStringLiteral("frameLabel"));
    statusBar()->addPermanentWidget(m_frameLabel);

    connect(m_waveformView, &WaveformView::scrollRangeChanged, this, [this](int maximum, int pageStep) {
        m_scrollBar->setRange(0, maximum);
        m_scrollBar->setPageStep(pageStep);
    });
    connect(m_waveformView, &WaveformView::frameChanged, this, [this](double startTime, double endTime) {
        const QSignalBlocker blocker(m_scrollBar);
        m_scrollBar->setValue(qRound(m_waveformView->projection().frameOffset()));
        updateFrameLabel(startTime, endTime);
    });
    connect(m_scrollBar, &QScrollBar::valueChanged, this, [this](int value) {
        m_waveformView->setFrameOffset(value);
    });
    connect(m_waveformView, &WaveformView::timeDoubleClicked, this, &MainWindow::addPointAt);
}

QToolBar *MainWindow::createToolBar()
{
    auto *toolbar = new QToolBar(tr("Marker"), this);
    toolbar->setMovable(false);

    auto *editAction = toolbar->addAction(tr("Bearbeiten"));
    editAction->setCheckable(true);
    editAction->setChecked(m_settings.editable);
    editAction->setShortcut(QKeySequence(Qt::Key_E));
    connect(editAction, &QAction::toggled, this, [this](bool checked) {
        m_settings.editable = checked;
        m_waveformView->pointsLayer().enableEditing(checked);
    });

    auto *visibleAction = toolbar->addAction(tr("Marker anzeigen"));
    visibleAction->setCheckable(true);
    visibleAction->setChecked(true);
    connect(visibleAction, &QAction::toggled, this, [this](bool checked) {
        m_waveformView->pointsLayer().setVisible(checked);
    });

    toolbar->addSeparator();

    auto *addAction = toolbar->addAction(tr("Marker hinzufügen"));
    addAction->setShortcut(QKeySequence(Qt::Key_M));
    connect(addAction, &QAction::triggered, this, [this]() {
        const auto &projection = m_waveformView->projection();
        addPointAt((projection.startTime() + projection.endTime()) / 2.0);
    });

    auto *clearAction = toolbar->addAction(tr("Alle entfernen"));
    connect(clearAction, &QAction::triggered, this, [this]() { m_appContext->pointRepository().removeAll(); });

    toolbar->addSeparator();

    auto *zoomIn = toolbar->addAction(tr("Zoom +"));
    zoomIn->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Plus));
    connect(zoomIn, &QAction::triggered, this, [this]() { m_waveformView->zoom(true); });

    auto *zoomOut = toolbar->addAction(tr("Zoom -"));
    zoomOut->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Minus));
    connect(zoomOut, &QAction::triggered, this, [this]() { m_waveformView->zoom(false); });

    return toolbar;
}

void MainWindow::connectPointEvents()
{
    auto &bus = m_appContext->eventBus();
    const auto describe = [this](const core::PointEvent &event) {
        const QString label = event.point->labelText().isEmpty() ? event.point->id() : event.point->labelText();
        return tr("%1 bei %2").arg(label, m_waveformView->pointsLayer().formatTime(event.point->time()));
    };

    connect(&bus, &core::EventBus::pointClicked, this, [this, describe](const core::PointEvent &event) {
        statusBar()->showMessage(tr("Ausgewählt: %1").arg(describe(event)), 3000);
    });
    connect(&bus, &core::EventBus::pointDragMoved, this, [this, describe](const core::PointEvent &event) {
        statusBar()->showMessage(describe(event));
    });
    connect(&bus, &core::EventBus::pointDragEnded, this, [this, describe](const core::PointEvent &event) {
        statusBar()->showMessage(tr("Verschoben: %1").arg(describe(event)), 3000);
    });
    connect(&bus, &core::EventBus::pointDoubleClicked, this, [this](const core::PointEvent &event) {
        bool ok = false;
        const QString text = QInputDialog::getText(this, tr("Marker umbenennen"), tr("Bezeichnung:"),
                                                   QLineEdit::Normal, event.point->labelText(), &ok);
        if (!ok) {
            return;
        }
        data::PointOptions options;
        options.labelText = text;
        m_appContext->pointRepository().update(event.point->id(), options);
    });
    connect(&bus, &core::EventBus::pointContextMenuRequested, this, &MainWindow::showPointContextMenu);

    // The layer subscribed first, so its markers are current here.
    connect(&bus, &core::EventBus::pointsAdded, this, &MainWindow::refreshFrameLabel);
    connect(&bus, &core::EventBus::pointUpdated, this, &MainWindow::refreshFrameLabel);
    connect(&bus, &core::EventBus::pointsRemoved, this, &MainWindow::refreshFrameLabel);
    connect(&bus, &core::EventBus::allPointsRemoved, this, &MainWindow::refreshFrameLabel);
}

void MainWindow::addPointAt(double time)
{
    data::PointOptions options;
    options.time = time;
    options.editable = true;
    options.labelText = tr("Marker");
    if (m_appContext->pointRepository().add({ options }).empty()) {
        statusBar()->showMessage(tr("Marker konnte nicht angelegt werden"), 3000);
    }
}

void MainWindow::showPointContextMenu(const core::PointEvent &event)
{
    const QString pointId = event.point->id();
    const bool editable = event.point->editable();

    QMenu menu(this);
    auto *lockAction = menu.addAction(editable ? tr("Sperren") : tr("Entsperren"));
    auto *removeAction = menu.addAction(tr("Entfernen"));
    QAction *chosen = menu.exec(QCursor::pos());
    // The point may be gone once the menu returns.
    if (chosen == removeAction) {
        m_appContext->pointRepository().removeById(pointId);
    } else if (chosen == lockAction) {
        data::PointOptions options;
        options.editable = !editable;
        m_appContext->pointRepository().update(pointId, options);
    }
}

void MainWindow::updateFrameLabel(double startTime, double endTime)
{
    const auto &layer = m_waveformView->pointsLayer();
    m_frameLabel->setText(tr("%1 - %2  |  %3 Marker")
                              .arg(layer.formatTime(startTime), layer.formatTime(endTime))
                              .arg(static_cast<qulonglong>(layer.markerCount())));
}

void MainWindow::refreshFrameLabel()
{
    const auto &projection = m_waveformView->projection();
    updateFrameLabel(projection.startTime(), projection.endTime());
}

void MainWindow::saveSettings() const
{
    QSettings settings;
    core::saveViewerSettings(settings, m_settings);
}

} // namespace ui
} // namespace waveview
