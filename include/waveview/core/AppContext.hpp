#pragma once

#include <memory>

namespace waveview {
namespace data {
class PointRepository;
}

namespace core {

class EventBus;

class AppContext
{
public:
    AppContext();
    ~AppContext();

    EventBus &eventBus();
    data::PointRepository &pointRepository();

private:
    void seedDemoData();

    // Declared first: the repository publishes on the bus until it is gone.
    std::unique_ptr<EventBus> m_eventBus;
    std::unique_ptr<data::PointRepository> m_pointRepository;
};

} // namespace core
} // namespace waveview
