#include "waveview/data/Point.hpp"

#include <utility>

namespace waveview {
namespace data {

Point::Point(QString id, double time)
    : m_id(std::move(id))
    , m_time(time)
{
}

void Point::setTime(double time)
{
    m_time = time;
}

void Point::setLabelText(const QString &text)
{
    m_labelText = text;
}

void Point::setColor(const QColor &color)
{
    m_color = color;
}

void Point::setEditable(bool editable)
{
    m_editable = editable;
}

void Point::apply(const PointOptions &options)
{
    if (options.time) {
        setTime(*options.time);
    }
    if (options.labelText) {
        setLabelText(*options.labelText);
    }
    if (options.color) {
        setColor(*options.color);
    }
    if (options.editable) {
        setEditable(*options.editable);
    }
}

bool Point::isVisible(double startTime, double endTime) const
{
    return m_time >= startTime && m_time < endTime;
}

} // namespace data
} // namespace waveview
