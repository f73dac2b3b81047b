#pragma once

#include <QGraphicsObject>
#include <functional>
#include <memory>

#include "waveview/core/PointerEvent.hpp"

namespace waveview {
namespace data {
class Point;
}

namespace ui {

class Marker;

// Scene item for one point. Hosts the factory-built Marker's graphics and
// turns scene pointer events into signals. A press and release without
// motion is a click; motion beyond the drag distance on a draggable marker
// starts a horizontal drag.
class PointMarker : public QGraphicsObject
{
    Q_OBJECT

public:
    // Receives the proposed scene position, returns the allowed one.
    using DragBoundFunc = std::function<QPointF(const PointMarker &marker, const QPointF &scenePos)>;

    PointMarker(data::Point &point, bool draggable, std::unique_ptr<Marker> marker, QGraphicsItem *parent = nullptr);
    ~PointMarker() override;

    data::Point &point() const { return m_point; }
    bool isDraggable() const { return m_draggable; }
    bool isDragging() const { return m_dragging; }
    double width() const;

    void setDragBoundFunc(DragBoundFunc func);
    void timeUpdated(double time);
    void fitToView(double height);

    QRectF boundingRect() const override;
    void paint(QPainter *painter, const QStyleOptionGraphicsItem *option, QWidget *widget) override;

signals:
    void clicked(const core::PointerEvent &evt);
    void doubleClicked(const core::PointerEvent &evt);
    void dragStarted(const core::PointerEvent &evt);
    void dragMoved(const core::PointerEvent &evt);
    void dragEnded(const core::PointerEvent &evt);
    void mouseEntered(const core::PointerEvent &evt);
    void mouseLeft(const core::PointerEvent &evt);
    void contextMenuRequested(const core::PointerEvent &evt);

protected:
    QVariant itemChange(GraphicsItemChange change, const QVariant &value) override;
    void mousePressEvent(QGraphicsSceneMouseEvent *event) override;
    void mouseMoveEvent(QGraphicsSceneMouseEvent *event) override;
    void mouseReleaseEvent(QGraphicsSceneMouseEvent *event) override;
    void mouseDoubleClickEvent(QGraphicsSceneMouseEvent *event) override;
    void hoverEnterEvent(QGraphicsSceneHoverEvent *event) override;
    void hoverLeaveEvent(QGraphicsSceneHoverEvent *event) override;
    void contextMenuEvent(QGraphicsSceneContextMenuEvent *event) override;

private:
    void releaseChildInput();
    QPointF toParent(const QPointF &scenePos) const;

    data::Point &m_point;
    bool m_draggable = false;
    std::unique_ptr<Marker> m_marker;
    DragBoundFunc m_dragBoundFunc;
    bool m_pressed = false;
    bool m_dragging = false;
    QPointF m_pressScenePos;
    QPointF m_pressItemPos;
};

} // namespace ui
} // namespace waveview
