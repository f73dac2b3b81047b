#include "waveview/ui/markers/PointMarker.hpp"

#include <QApplication>
#include <QCursor>
#include <QGraphicsSceneContextMenuEvent>
#include <QGraphicsSceneHoverEvent>
#include <QGraphicsSceneMouseEvent>
#include <QPointer>
#include <utility>

#include "waveview/ui/markers/Marker.hpp"

namespace waveview {
namespace ui {

namespace {

core::PointerEvent pointerEventFrom(const QGraphicsSceneMouseEvent &event)
{
    core::PointerEvent evt;
    evt.type = event.type();
    evt.scenePos = event.scenePos();
    evt.screenPos = event.screenPos();
    evt.button = event.button();
    evt.buttons = event.buttons();
    evt.modifiers = event.modifiers();
    return evt;
}

core::PointerEvent pointerEventFrom(const QGraphicsSceneHoverEvent &event)
{
    core::PointerEvent evt;
    evt.type = event.type();
    evt.scenePos = event.scenePos();
    evt.screenPos = event.screenPos();
    evt.modifiers = event.modifiers();
    return evt;
}

core::PointerEvent pointerEventFrom(const QGraphicsSceneContextMenuEvent &event)
{
    core::PointerEvent evt;
    evt.type = event.type();
    evt.scenePos = event.scenePos();
    evt.screenPos = event.screenPos();
    evt.button = Qt::RightButton;
    evt.modifiers = event.modifiers();
    return evt;
}

} // namespace

PointMarker::PointMarker(data::Point &point, bool draggable, std::unique_ptr<Marker> marker, QGraphicsItem *parent)
    : QGraphicsObject(parent)
    , m_point(point)
    , m_draggable(draggable)
    , m_marker(std::move(marker))
{
    setFlag(QGraphicsItem::ItemSendsGeometryChanges, true);
    setAcceptHoverEvents(true);
    setAcceptedMouseButtons(Qt::LeftButton);
    if (m_draggable) {
        setCursor(Qt::SizeHorCursor);
    }
    if (m_marker) {
        m_marker->init(this);
        releaseChildInput();
    }
}

PointMarker::~PointMarker()
{
    if (m_marker) {
        m_marker->destroy();
    }
}

double PointMarker::width() const
{
    return m_marker ? m_marker->width() : 0.0;
}

void PointMarker::setDragBoundFunc(DragBoundFunc func)
{
    m_dragBoundFunc = std::move(func);
}

void PointMarker::timeUpdated(double time)
{
    if (m_marker) {
        m_marker->timeUpdated(time);
    }
}

void PointMarker::fitToView(double height)
{
    prepareGeometryChange();
    if (m_marker) {
        m_marker->fitToView(height);
    }
}

QRectF PointMarker::boundingRect() const
{
    return childrenBoundingRect();
}

void PointMarker::paint(QPainter *painter, const QStyleOptionGraphicsItem *option, QWidget *widget)
{
    // The marker variant draws through child items.
    Q_UNUSED(painter);
    Q_UNUSED(option);
    Q_UNUSED(widget);
}

QVariant PointMarker::itemChange(GraphicsItemChange change, const QVariant &value)
{
    if (change == ItemPositionChange && m_dragging && m_dragBoundFunc) {
        const QPointF proposed = value.toPointF();
        const QPointF sceneProposed = parentItem() ? parentItem()->mapToScene(proposed) : proposed;
        return toParent(m_dragBoundFunc(*this, sceneProposed));
    }
    return QGraphicsObject::itemChange(change, value);
}

void PointMarker::mousePressEvent(QGraphicsSceneMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }
    m_pressed = true;
    m_pressScenePos = event->scenePos();
    m_pressItemPos = pos();
    event->accept();
}

void PointMarker::mouseMoveEvent(QGraphicsSceneMouseEvent *event)
{
    if (!m_pressed || !m_draggable || !(event->buttons() & Qt::LeftButton)) {
        return;
    }
    if (!m_dragging) {
        if ((event->scenePos() - m_pressScenePos).manhattanLength() < QApplication::startDragDistance()) {
            return;
        }
        m_dragging = true;
        QPointer<PointMarker> self(this);
        emit dragStarted(pointerEventFrom(*event));
        if (!self) {
            return;
        }
    }
    const QPointF delta = toParent(event->scenePos()) - toParent(m_pressScenePos);
    setPos(m_pressItemPos + delta);
    emit dragMoved(pointerEventFrom(*event));
}

void PointMarker::mouseReleaseEvent(QGraphicsSceneMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || !m_pressed) {
        return;
    }
    const bool wasDragging = m_dragging;
    m_pressed = false;
    m_dragging = false;
    if (wasDragging) {
        emit dragEnded(pointerEventFrom(*event));
    } else {
        emit clicked(pointerEventFrom(*event));
    }
}

void PointMarker::mouseDoubleClickEvent(QGraphicsSceneMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }
    // Qt replaces the second press with this event; keep the press state so
    // the following release still reports a click.
    m_pressed = true;
    m_pressScenePos = event->scenePos();
    m_pressItemPos = pos();
    emit doubleClicked(pointerEventFrom(*event));
    event->accept();
}

void PointMarker::hoverEnterEvent(QGraphicsSceneHoverEvent *event)
{
    emit mouseEntered(pointerEventFrom(*event));
}

void PointMarker::hoverLeaveEvent(QGraphicsSceneHoverEvent *event)
{
    emit mouseLeft(pointerEventFrom(*event));
}

void PointMarker::contextMenuEvent(QGraphicsSceneContextMenuEvent *event)
{
    emit contextMenuRequested(pointerEventFrom(*event));
    event->accept();
}

void PointMarker::releaseChildInput()
{
    // Children are drawing only; input lands on the marker itself.
    const auto children = childItems();
    for (QGraphicsItem *child : children) {
        child->setAcceptedMouseButtons(Qt::NoButton);
        child->setAcceptHoverEvents(false);
    }
}

QPointF PointMarker::toParent(const QPointF &scenePos) const
{
    return parentItem() ? parentItem()->mapFromScene(scenePos) : scenePos;
}

} // namespace ui
} // namespace waveview
