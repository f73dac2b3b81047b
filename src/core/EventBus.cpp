#include "waveview/core/EventBus.hpp"

namespace waveview {
namespace core {

EventBus::EventBus(QObject *parent)
    : QObject(parent)
{
}

EventBus::~EventBus() = default;

} // namespace core
} // namespace waveview
