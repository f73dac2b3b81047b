#include "waveview/core/AppContext.hpp"

#include <QColor>
#include <QObject>

#include "waveview/core/EventBus.hpp"
#include "waveview/data/InMemoryPointRepository.hpp"

namespace waveview {
namespace core {

AppContext::AppContext()
    : m_eventBus(std::make_unique<EventBus>())
    , m_pointRepository(std::make_unique<data::InMemoryPointRepository>(*m_eventBus))
{
    seedDemoData();
}

AppContext::~AppContext() = default;

EventBus &AppContext::eventBus()
{
    return *m_eventBus;
}

data::PointRepository &AppContext::pointRepository()
{
    return *m_pointRepository;
}

void AppContext::seedDemoData()
{
    if (!m_pointRepository->points().empty()) {
        return;
    }

    data::PointOptions intro;
    intro.time = 1.5;
    intro.labelText = QObject::tr("Intro");
    intro.editable = true;

    data::PointOptions verse;
    verse.time = 12.0;
    verse.labelText = QObject::tr("Verse");
    verse.editable = true;

    data::PointOptions drop;
    drop.time = 31.25;
    drop.labelText = QObject::tr("Drop");
    drop.color = QColor(QStringLiteral("#ff851b"));

    m_pointRepository->add({ intro, verse, drop });
}

} // namespace core
} // namespace waveview
