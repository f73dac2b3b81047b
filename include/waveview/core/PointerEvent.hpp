#pragma once

#include <QEvent>
#include <QPointF>

namespace waveview {
namespace core {

// Copyable snapshot of the Qt pointer event that triggered an interaction.
// The QGraphicsScene*Event it is taken from only lives for the duration of its handler.
struct PointerEvent
{
    QEvent::Type type = QEvent::None;
    QPointF scenePos;
    QPointF screenPos;
    Qt::MouseButton button = Qt::NoButton;
    Qt::MouseButtons buttons = Qt::NoButton;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

} // namespace core
} // namespace waveview
