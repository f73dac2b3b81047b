#pragma once

#include <QPointF>
#include <optional>

#include "waveview/core/PointerEvent.hpp"

namespace waveview {
namespace core {
class EventBus;
}
namespace data {
class Point;
}

namespace ui {

class PointMarker;
class Viewport;

struct DragSession
{
    PointMarker *marker = nullptr;
    data::Point *point = nullptr;
    // Scene y of the marker when the drag began; motion is horizontal only.
    double anchorY = 0.0;
};

// Clamps x to [0, viewportWidth] and pins y to the session's anchor.
QPointF constrainDragPosition(const DragSession &session, const QPointF &scenePos, double viewportWidth);

// Edit gesture for one marker at a time: Idle -> Dragging -> Idle.
class PointDragController
{
public:
    PointDragController(core::EventBus &bus, const Viewport &view);

    // Returns false, and emits nothing, while another session is active.
    bool dragStart(PointMarker &marker, const core::PointerEvent &evt);
    void dragMove(PointMarker &marker, const core::PointerEvent &evt);
    void dragEnd(PointMarker &marker, const core::PointerEvent &evt);

    // Drops the session if it belongs to a marker that is going away.
    void forget(const PointMarker &marker);
    // Drops any session without touching its marker, which may already be gone.
    void reset();

    QPointF dragBound(const PointMarker &marker, const QPointF &scenePos) const;

    bool isDragging() const { return m_session.has_value(); }
    const std::optional<DragSession> &session() const { return m_session; }

private:
    bool owns(const PointMarker &marker) const;

    core::EventBus &m_bus;
    const Viewport &m_view;
    std::optional<DragSession> m_session;
};

} // namespace ui
} // namespace waveview
