#include "waveview/data/InMemoryPointRepository.hpp"

#include <QSet>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "waveview/core/EventBus.hpp"
#include "waveview/core/Logging.hpp"

namespace waveview {
namespace data {

namespace {

bool validateOptions(const PointOptions &options, bool requireTime, QString *error)
{
    if (requireTime && !options.time) {
        *error = QStringLiteral("time is required");
        return false;
    }
    if (options.time) {
        if (!std::isfinite(*options.time)) {
            *error = QStringLiteral("time must be a finite number");
            return false;
        }
        if (*options.time < 0.0) {
            *error = QStringLiteral("time must not be negative");
            return false;
        }
    }
    if (options.id && options.id->isEmpty()) {
        *error = QStringLiteral("id must not be empty");
        return false;
    }
    return true;
}

} // namespace

InMemoryPointRepository::InMemoryPointRepository(core::EventBus &bus)
    : m_bus(bus)
{
}

InMemoryPointRepository::~InMemoryPointRepository() = default;

std::vector<Point *> InMemoryPointRepository::points() const
{
    std::vector<Point *> points;
    points.reserve(m_points.size());
    for (const auto &point : m_points) {
        points.push_back(point.get());
    }
    return points;
}

std::vector<Point *> InMemoryPointRepository::find(double startTime, double endTime) const
{
    std::vector<Point *> points;
    for (const auto &point : m_points) {
        if (point->isVisible(startTime, endTime)) {
            points.push_back(point.get());
        }
    }
    return points;
}

Point *InMemoryPointRepository::findById(const QString &id) const
{
    return m_index.value(id, nullptr);
}

std::vector<Point *> InMemoryPointRepository::add(const std::vector<PointOptions> &options)
{
    // Validate the whole batch before touching the store so a bad entry
    // leaves no partial insert behind.
    QSet<QString> batchIds;
    for (const auto &entry : options) {
        QString error;
        if (!validateOptions(entry, true, &error)) {
            qCWarning(waveviewData) << "Rejecting points.add:" << error;
            return {};
        }
        if (entry.id) {
            if (m_index.contains(*entry.id) || batchIds.contains(*entry.id)) {
                qCWarning(waveviewData) << "Rejecting points.add: duplicate id" << *entry.id;
                return {};
            }
            batchIds.insert(*entry.id);
        }
    }

    std::vector<Point *> added;
    added.reserve(options.size());
    for (const auto &entry : options) {
        QString id;
        if (entry.id) {
            id = *entry.id;
        } else {
            do {
                id = nextPointId();
            } while (batchIds.contains(id));
        }
        auto point = std::make_unique<Point>(id, *entry.time);
        point->apply(entry);
        Point *raw = point.get();
        m_index.insert(raw->id(), raw);
        m_points.push_back(std::move(point));
        added.push_back(raw);
    }

    if (!added.empty()) {
        emit m_bus.pointsAdded(added);
    }
    return added;
}

bool InMemoryPointRepository::update(const QString &id, const PointOptions &options)
{
    Point *point = findById(id);
    if (!point) {
        return false;
    }
    QString error;
    if (!validateOptions(options, false, &error)) {
        qCWarning(waveviewData) << "Rejecting points.update for" << id << ":" << error;
        return false;
    }
    if (options.id && *options.id != id) {
        qCWarning(waveviewData) << "Rejecting points.update for" << id << ": id cannot be changed";
        return false;
    }
    point->apply(options);
    emit m_bus.pointUpdated(point, options);
    return true;
}

template <typename Predicate>
std::size_t InMemoryPointRepository::removeMatching(Predicate predicate)
{
    auto firstRemoved = std::stable_partition(m_points.begin(), m_points.end(),
                                              [&predicate](const std::unique_ptr<Point> &point) {
                                                  return !predicate(*point);
                                              });
    std::vector<std::unique_ptr<Point>> removed(std::make_move_iterator(firstRemoved),
                                                std::make_move_iterator(m_points.end()));
    m_points.erase(firstRemoved, m_points.end());
    if (removed.empty()) {
        return 0;
    }

    std::vector<Point *> notified;
    notified.reserve(removed.size());
    for (const auto &point : removed) {
        m_index.remove(point->id());
        notified.push_back(point.get());
    }
    emit m_bus.pointsRemoved(notified);
    return removed.size();
}

std::size_t InMemoryPointRepository::removeById(const QString &id)
{
    return removeMatching([&id](const Point &point) { return point.id() == id; });
}

std::size_t InMemoryPointRepository::removeByTime(double time)
{
    return removeMatching([time](const Point &point) { return point.time() == time; });
}

void InMemoryPointRepository::removeAll()
{
    // Listeners still see live points while the notification runs.
    emit m_bus.allPointsRemoved();
    m_index.clear();
    m_points.clear();
}

QString InMemoryPointRepository::nextPointId()
{
    QString id;
    do {
        id = QStringLiteral("point.%1").arg(m_pointIdCounter++);
    } while (m_index.contains(id));
    return id;
}

} // namespace data
} // namespace waveview
