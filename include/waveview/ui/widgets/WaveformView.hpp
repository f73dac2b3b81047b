#pragma once

#include <QGraphicsView>
#include <memory>

#include "waveview/core/ViewerSettings.hpp"
#include "waveview/ui/ZoomViewport.hpp"
#include "waveview/ui/markers/DefaultPointMarkerFactory.hpp"

class QGraphicsScene;

namespace waveview {
namespace core {
class AppContext;
}

namespace ui {

class PointsLayer;

// Scrolling zoom view. Scene coordinates are pixels relative to the left
// edge of the visible frame, so the scene itself never scrolls; scrolling
// moves the frame offset and re-synchronizes the layers.
class WaveformView : public QGraphicsView
{
    Q_OBJECT

public:
    WaveformView(core::AppContext &context, const core::ViewerSettings &settings, QWidget *parent = nullptr);
    ~WaveformView() override;

    const ZoomViewport &projection() const { return m_projection; }
    PointsLayer &pointsLayer() { return *m_pointsLayer; }

    void setFrameOffset(double offset);
    void zoom(bool in);

signals:
    void frameChanged(double startTime, double endTime);
    void scrollRangeChanged(int maximum, int pageStep);
    void timeDoubleClicked(double time);

protected:
    void resizeEvent(QResizeEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void drawBackground(QPainter *painter, const QRectF &rect) override;

private:
    void synchronize();
    void updateScrollRange();
    double maxFrameOffset() const;

    ZoomViewport m_projection;
    DefaultPointMarkerFactory m_markerFactory;
    QGraphicsScene *m_scene = nullptr;
    std::unique_ptr<PointsLayer> m_pointsLayer;
    double m_duration = 60.0;
};

} // namespace ui
} // namespace waveview
