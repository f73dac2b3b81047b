#include "waveview/ui/markers/DefaultPointMarkerFactory.hpp"

#include "waveview/ui/markers/DefaultPointMarker.hpp"

namespace waveview {
namespace ui {

std::unique_ptr<Marker> DefaultPointMarkerFactory::createPointMarker(const PointMarkerOptions &options)
{
    return std::make_unique<DefaultPointMarker>(options);
}

} // namespace ui
} // namespace waveview
