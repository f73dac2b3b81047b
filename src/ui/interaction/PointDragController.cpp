#include "waveview/ui/interaction/PointDragController.hpp"

#include <QtGlobal>

#include "waveview/core/EventBus.hpp"
#include "waveview/core/Logging.hpp"
#include "waveview/data/Point.hpp"
#include "waveview/ui/Viewport.hpp"
#include "waveview/ui/markers/PointMarker.hpp"

namespace waveview {
namespace ui {

QPointF constrainDragPosition(const DragSession &session, const QPointF &scenePos, double viewportWidth)
{
    return QPointF(qBound(0.0, scenePos.x(), qMax(0.0, viewportWidth)), session.anchorY);
}

PointDragController::PointDragController(core::EventBus &bus, const Viewport &view)
    : m_bus(bus)
    , m_view(view)
{
}

bool PointDragController::dragStart(PointMarker &marker, const core::PointerEvent &evt)
{
    if (m_session) {
        qCWarning(waveviewDrag) << "Ignoring drag of" << marker.point().id() << "while"
                                << m_session->point->id() << "is being dragged";
        return false;
    }

    DragSession session;
    session.marker = &marker;
    session.point = &marker.point();
    session.anchorY = marker.scenePos().y();
    m_session = session;
    qCDebug(waveviewDrag) << "Drag started" << session.point->id() << "at" << session.point->time();

    emit m_bus.pointDragStarted(core::PointEvent{ session.point, evt });
    return true;
}

void PointDragController::dragMove(PointMarker &marker, const core::PointerEvent &evt)
{
    if (!owns(marker)) {
        return;
    }
    data::Point *point = m_session->point;

    // The anchor sits at the right edge of the marker body.
    const double offset = marker.x() + marker.width();
    point->setTime(m_view.pixelOffsetToTime(offset));
    marker.timeUpdated(point->time());

    emit m_bus.pointDragMoved(core::PointEvent{ point, evt });
}

void PointDragController::dragEnd(PointMarker &marker, const core::PointerEvent &evt)
{
    if (!owns(marker)) {
        return;
    }
    data::Point *point = m_session->point;
    m_session.reset();
    qCDebug(waveviewDrag) << "Drag ended" << point->id() << "at" << point->time();

    emit m_bus.pointDragEnded(core::PointEvent{ point, evt });
}

void PointDragController::forget(const PointMarker &marker)
{
    if (owns(marker)) {
        qCDebug(waveviewDrag) << "Dropping drag session of destroyed marker" << m_session->point->id();
        m_session.reset();
    }
}

void PointDragController::reset()
{
    if (m_session) {
        qCDebug(waveviewDrag) << "Abandoning drag of" << m_session->point->id();
        m_session.reset();
    }
}

QPointF PointDragController::dragBound(const PointMarker &marker, const QPointF &scenePos) const
{
    if (!owns(marker)) {
        // A marker whose drag was refused stays where it is.
        return marker.scenePos();
    }
    return constrainDragPosition(*m_session, scenePos, m_view.width());
}

bool PointDragController::owns(const PointMarker &marker) const
{
    return m_session && m_session->marker == &marker;
}

} // namespace ui
} // namespace waveview
