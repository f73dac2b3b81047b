#pragma once

#include <QMainWindow>
#include <memory>

#include "waveview/core/EventBus.hpp"
#include "waveview/core/ViewerSettings.hpp"

class QLabel;
class QScrollBar;
class QToolBar;

namespace waveview {
namespace core {
class AppContext;
}

namespace ui {

class WaveformView;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void setupUi();
    QToolBar *createToolBar();
    void connectPointEvents();
    void addPointAt(double time);
    void showPointContextMenu(const core::PointEvent &event);
    void updateFrameLabel(double startTime, double endTime);
    void refreshFrameLabel();
    void saveSettings() const;

    std::unique_ptr<core::AppContext> m_appContext;
    core::ViewerSettings m_settings;
    WaveformView *m_waveformView = nullptr;
    QScrollBar *m_scrollBar = nullptr;
    QLabel *m_frameLabel = nullptr;
};

} // namespace ui
} // namespace waveview
