#pragma once

#include <QColor>
#include <QString>

#include "waveview/data/PointOptions.hpp"

namespace waveview {
namespace data {

class Point
{
public:
    Point(QString id, double time);

    const QString &id() const { return m_id; }
    double time() const { return m_time; }
    const QString &labelText() const { return m_labelText; }
    // Invalid when the point uses the view's default marker color.
    const QColor &color() const { return m_color; }
    bool editable() const { return m_editable; }

    // The only way a point's time changes. Does not notify anyone; callers
    // that need listeners informed go through the repository.
    void setTime(double time);
    void setLabelText(const QString &text);
    void setColor(const QColor &color);
    void setEditable(bool editable);
    void apply(const PointOptions &options);

    // Half-open: startTime <= time < endTime.
    bool isVisible(double startTime, double endTime) const;

private:
    QString m_id;
    double m_time = 0.0;
    QString m_labelText;
    QColor m_color;
    bool m_editable = false;
};

} // namespace data
} // namespace waveview
