#pragma once

#include <QHash>
#include <memory>

#include "waveview/data/PointRepository.hpp"

namespace waveview {
namespace core {
class EventBus;
}

namespace data {

class InMemoryPointRepository : public PointRepository
{
public:
    explicit InMemoryPointRepository(core::EventBus &bus);
    ~InMemoryPointRepository() override;

    std::vector<Point *> points() const override;
    std::vector<Point *> find(double startTime, double endTime) const override;
    Point *findById(const QString &id) const override;
    std::vector<Point *> add(const std::vector<PointOptions> &options) override;
    bool update(const QString &id, const PointOptions &options) override;
    std::size_t removeById(const QString &id) override;
    std::size_t removeByTime(double time) override;
    void removeAll() override;

private:
    QString nextPointId();
    template <typename Predicate>
    std::size_t removeMatching(Predicate predicate);

    core::EventBus &m_bus;
    std::vector<std::unique_ptr<Point>> m_points;
    QHash<QString, Point *> m_index;
    int m_pointIdCounter = 0;
};

} // namespace data
} // namespace waveview
