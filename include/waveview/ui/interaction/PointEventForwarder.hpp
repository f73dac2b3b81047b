#pragma once

#include "waveview/core/PointerEvent.hpp"

namespace waveview {
namespace core {
class EventBus;
}
namespace data {
class Point;
}

namespace ui {

// Publishes marker interactions as { point, evt } on the bus, one event per
// interaction, synchronously.
class PointEventForwarder
{
public:
    explicit PointEventForwarder(core::EventBus &bus);

    void click(data::Point &point, const core::PointerEvent &evt) const;
    void doubleClick(data::Point &point, const core::PointerEvent &evt) const;
    void mouseEnter(data::Point &point, const core::PointerEvent &evt) const;
    void mouseLeave(data::Point &point, const core::PointerEvent &evt) const;
    void contextMenu(data::Point &point, const core::PointerEvent &evt) const;

private:
    core::EventBus &m_bus;
};

} // namespace ui
} // namespace waveview
