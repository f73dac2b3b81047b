#include "waveview/ui/interaction/PointEventForwarder.hpp"

#include "waveview/core/EventBus.hpp"

namespace waveview {
namespace ui {

PointEventForwarder::PointEventForwarder(core::EventBus &bus)
    : m_bus(bus)
{
}

void PointEventForwarder::click(data::Point &point, const core::PointerEvent &evt) const
{
    emit m_bus.pointClicked(core::PointEvent{ &point, evt });
}

void PointEventForwarder::doubleClick(data::Point &point, const core::PointerEvent &evt) const
{
    emit m_bus.pointDoubleClicked(core::PointEvent{ &point, evt });
}

void PointEventForwarder::mouseEnter(data::Point &point, const core::PointerEvent &evt) const
{
    emit m_bus.pointMouseEntered(core::PointEvent{ &point, evt });
}

void PointEventForwarder::mouseLeave(data::Point &point, const core::PointerEvent &evt) const
{
    emit m_bus.pointMouseLeft(core::PointEvent{ &point, evt });
}

void PointEventForwarder::contextMenu(data::Point &point, const core::PointerEvent &evt) const
{
    emit m_bus.pointContextMenuRequested(core::PointEvent{ &point, evt });
}

} // namespace ui
} // namespace waveview
