#include "waveview/ui/widgets/WaveformView.hpp"

#include <QGraphicsScene>
#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QWheelEvent>
#include <QtMath>
#include <cmath>

#include "waveview/core/AppContext.hpp"
#include "waveview/core/EventBus.hpp"
#include "waveview/ui/layers/PointsLayer.hpp"

namespace waveview {
namespace ui {

namespace {
constexpr double WheelStepPixels = 40.0;
}

WaveformView::WaveformView(core::AppContext &context, const core::ViewerSettings &settings, QWidget *parent)
    : QGraphicsView(parent)
    , m_scene(new QGraphicsScene(this))
{
    m_projection.setSampleRate(settings.sampleRate);
    m_projection.setScale(qBound(core::MinScale, settings.scale, core::MaxScale));

    m_scene->setItemIndexMethod(QGraphicsScene::NoIndex);
    setScene(m_scene);
    setAlignment(Qt::AlignLeft | Qt::AlignTop);
    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setRenderHint(QPainter::Antialiasing, true);
    setMinimumHeight(120);

    m_pointsLayer = std::make_unique<PointsLayer>(context.eventBus(),
                                                  context.pointRepository(),
                                                  m_projection,
                                                  m_markerFactory,
                                                  settings.pointStyle,
                                                  settings.editable);
    m_pointsLayer->addToScene(m_scene);
}

WaveformView::~WaveformView() = default;

void WaveformView::setFrameOffset(double offset)
{
    m_projection.setFrameOffset(qBound(0.0, offset, maxFrameOffset()));
    synchronize();
}

void WaveformView::zoom(bool in)
{
    const double startTime = m_projection.startTime();
    const int scale = in ? m_projection.scale() / 2 : m_projection.scale() * 2;
    m_projection.setScale(qBound(core::MinScale, scale, core::MaxScale));
    updateScrollRange();
    setFrameOffset(m_projection.timeToPixels(startTime));
}

void WaveformView::resizeEvent(QResizeEvent *event)
{
    QGraphicsView::resizeEvent(event);
    const QSize size = viewport()->size();
    m_projection.setSize(size.width(), size.height());
    m_scene->setSceneRect(0.0, 0.0, size.width(), size.height());
    m_pointsLayer->fitToView();
    updateScrollRange();
    setFrameOffset(m_projection.frameOffset());
}

void WaveformView::wheelEvent(QWheelEvent *event)
{
    const QPoint angle = event->angleDelta();
    if (event->modifiers() & Qt::ControlModifier) {
        if (angle.y() != 0) {
            zoom(angle.y() > 0);
        }
        event->accept();
        return;
    }
    const int delta = angle.x() != 0 ? angle.x() : angle.y();
    if (delta == 0) {
        QGraphicsView::wheelEvent(event);
        return;
    }
    setFrameOffset(m_projection.frameOffset() - (delta / 120.0) * WheelStepPixels);
    event->accept();
}

void WaveformView::mouseDoubleClickEvent(QMouseEvent *event)
{
    if (itemAt(event->pos())) {
        QGraphicsView::mouseDoubleClickEvent(event);
        return;
    }
    emit timeDoubleClicked(m_projection.pixelOffsetToTime(event->position().x()));
    event->accept();
}

void WaveformView::drawBackground(QPainter *painter, const QRectF &rect)
{
    painter->fillRect(rect, palette().base());

    const double height = m_projection.height();
    painter->setPen(QPen(palette().mid().color(), 1.0));
    painter->drawLine(QPointF(rect.left(), height / 2.0), QPointF(rect.right(), height / 2.0));

    // One tick per second across the visible frame.
    const double firstSecond = std::ceil(m_projection.startTime());
    const double lastSecond = qMin(m_projection.endTime(), m_duration);
    painter->setPen(QPen(palette().midlight().color(), 1.0));
    for (double second = firstSecond; second <= lastSecond; second += 1.0) {
        const double x = m_projection.timeToPixels(second) - m_projection.frameOffset();
        painter->drawLine(QPointF(x, 0.0), QPointF(x, 6.0));
    }
}

void WaveformView::synchronize()
{
    m_pointsLayer->synchronizeWindow(m_projection.startTime(), m_projection.endTime());
    m_scene->update();
    emit frameChanged(m_projection.startTime(), m_projection.endTime());
}

void WaveformView::updateScrollRange()
{
    emit scrollRangeChanged(qCeil(maxFrameOffset()), qMax(1, qRound(m_projection.width())));
}

double WaveformView::maxFrameOffset() const
{
    return qMax(0.0, m_projection.timeToPixels(m_duration) - m_projection.width());
}

} // namespace ui
} // namespace waveview
