#pragma once

#include <QObject>
#include <vector>

#include "waveview/core/PointerEvent.hpp"
#include "waveview/data/Point.hpp"
#include "waveview/data/PointOptions.hpp"

namespace waveview {
namespace core {

struct PointEvent
{
    data::Point *point = nullptr;
    PointerEvent evt;
};

// Shared application bus. Each signal is one topic; the store publishes the
// mutation topics, the points layers publish the interaction topics.
class EventBus : public QObject
{
    Q_OBJECT

public:
    explicit EventBus(QObject *parent = nullptr);
    ~EventBus() override;

signals:
    // points.add / points.update / points.remove / points.remove_all
    void pointsAdded(const std::vector<data::Point *> &points);
    void pointUpdated(data::Point *point, const data::PointOptions &options);
    void pointsRemoved(const std::vector<data::Point *> &points);
    void allPointsRemoved();

    // points.dragstart / points.dragmove / points.dragend
    void pointDragStarted(const core::PointEvent &event);
    void pointDragMoved(const core::PointEvent &event);
    void pointDragEnded(const core::PointEvent &event);

    // points.click / points.dblclick / points.mouseenter / points.mouseleave / points.contextmenu
    void pointClicked(const core::PointEvent &event);
    void pointDoubleClicked(const core::PointEvent &event);
    void pointMouseEntered(const core::PointEvent &event);
    void pointMouseLeft(const core::PointEvent &event);
    void pointContextMenuRequested(const core::PointEvent &event);
};

} // namespace core
} // namespace waveview

Q_DECLARE_METATYPE(waveview::core::PointEvent)
