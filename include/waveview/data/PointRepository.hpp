#pragma once

#include <cstddef>
#include <vector>

#include "waveview/data/Point.hpp"
#include "waveview/data/PointOptions.hpp"

namespace waveview {
namespace data {

// Owns the points. Returned pointers stay valid until the point is removed.
class PointRepository
{
public:
    virtual ~PointRepository() = default;

    virtual std::vector<Point *> points() const = 0;
    virtual std::vector<Point *> find(double startTime, double endTime) const = 0;
    virtual Point *findById(const QString &id) const = 0;
    virtual std::vector<Point *> add(const std::vector<PointOptions> &options) = 0;
    virtual bool update(const QString &id, const PointOptions &options) = 0;
    virtual std::size_t removeById(const QString &id) = 0;
    virtual std::size_t removeByTime(double time) = 0;
    virtual void removeAll() = 0;
};

} // namespace data
} // namespace waveview
