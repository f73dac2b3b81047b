#pragma once

#include <QtGlobal>

class QGraphicsItem;

namespace waveview {
namespace ui {

// Visual variant of a point marker, supplied by a PointMarkerFactory.
// The variant draws into the group handed to init(); the hosting
// PointMarker owns the group and handles all pointer input.
class Marker
{
public:
    virtual ~Marker() = default;

    virtual void init(QGraphicsItem *group) = 0;
    virtual void fitToView(double height) = 0;
    virtual void timeUpdated(double time) { Q_UNUSED(time); }
    virtual void destroy() {}

    // Horizontal extent of the body to the left of the anchor. Added to the
    // marker's x when a drag position is converted back to a time.
    virtual double width() const { return 0.0; }
};

} // namespace ui
} // namespace waveview
