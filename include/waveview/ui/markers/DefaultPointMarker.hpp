#pragma once

#include <QFont>

#include "waveview/ui/markers/Marker.hpp"
#include "waveview/ui/markers/PointMarkerFactory.hpp"

class QGraphicsLineItem;
class QGraphicsRectItem;
class QGraphicsSimpleTextItem;

namespace waveview {
namespace ui {

// Vertical line at the point's time with a label at the top. Draggable
// markers also get a grab handle and a time label.
class DefaultPointMarker : public Marker
{
public:
    explicit DefaultPointMarker(const PointMarkerOptions &options);
    ~DefaultPointMarker() override;

    void init(QGraphicsItem *group) override;
    void fitToView(double height) override;
    void timeUpdated(double time) override;

private:
    QFont labelFont() const;
    QString formatTime(double time) const;

    PointMarkerOptions m_options;
    QGraphicsLineItem *m_line = nullptr;
    QGraphicsRectItem *m_handle = nullptr;
    QGraphicsSimpleTextItem *m_label = nullptr;
    QGraphicsSimpleTextItem *m_time = nullptr;
};

} // namespace ui
} // namespace waveview
