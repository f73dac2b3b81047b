#pragma once

#include "waveview/ui/markers/PointMarkerFactory.hpp"

namespace waveview {
namespace ui {

class DefaultPointMarkerFactory : public PointMarkerFactory
{
public:
    std::unique_ptr<Marker> createPointMarker(const PointMarkerOptions &options) override;
};

} // namespace ui
} // namespace waveview
