#pragma once

#include <QColor>
#include <QString>
#include <memory>

namespace waveview {
namespace data {
class Point;
}

namespace ui {

class Marker;
class PointsLayer;

struct PointMarkerOptions
{
    data::Point *point = nullptr;
    bool draggable = false;
    QColor color;
    QString fontFamily;
    int fontSize = 0;
    QString fontStyle;
    const PointsLayer *layer = nullptr;
    QString view;
};

class PointMarkerFactory
{
public:
    virtual ~PointMarkerFactory() = default;

    virtual std::unique_ptr<Marker> createPointMarker(const PointMarkerOptions &options) = 0;
};

} // namespace ui
} // namespace waveview
