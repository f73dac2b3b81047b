#include "waveview/ui/markers/DefaultPointMarker.hpp"

#include <QBrush>
#include <QGraphicsLineItem>
#include <QGraphicsRectItem>
#include <QGraphicsSimpleTextItem>
#include <QPen>

#include "waveview/data/Point.hpp"
#include "waveview/ui/layers/PointsLayer.hpp"

namespace waveview {
namespace ui {

namespace {
constexpr double HandleWidth = 10.0;
constexpr double HandleHeight = 20.0;
constexpr double LabelPadding = 2.0;
}

DefaultPointMarker::DefaultPointMarker(const PointMarkerOptions &options)
    : m_options(options)
{
}

DefaultPointMarker::~DefaultPointMarker() = default;

void DefaultPointMarker::init(QGraphicsItem *group)
{
    const QColor color = m_options.color.isValid() ? m_options.color : QColor(Qt::black);

    m_line = new QGraphicsLineItem(group);
    m_line->setPen(QPen(color, 1.0));

    if (m_options.draggable) {
        m_handle = new QGraphicsRectItem(-HandleWidth / 2.0, 0.0, HandleWidth, HandleHeight, group);
        m_handle->setPen(Qt::NoPen);
        m_handle->setBrush(color);

        m_time = new QGraphicsSimpleTextItem(group);
        m_time->setFont(labelFont());
        m_time->setBrush(color);
    }

    m_label = new QGraphicsSimpleTextItem(group);
    m_label->setFont(labelFont());
    m_label->setBrush(color);
    m_label->setPos(LabelPadding, 0.0);
    if (m_options.point) {
        m_label->setText(m_options.point->labelText());
        timeUpdated(m_options.point->time());
    }

    fitToView(m_options.layer ? m_options.layer->height() : 0.0);
}

void DefaultPointMarker::fitToView(double height)
{
    if (m_line) {
        m_line->setLine(0.0, 0.0, 0.0, height);
    }
    if (m_handle) {
        m_handle->setY(height / 2.0 - HandleHeight / 2.0);
    }
    if (m_time) {
        m_time->setPos(-m_time->boundingRect().width() - HandleWidth / 2.0 - LabelPadding,
                       height / 2.0 - m_time->boundingRect().height() / 2.0);
    }
}

void DefaultPointMarker::timeUpdated(double time)
{
    if (!m_time) {
        return;
    }
    m_time->setText(formatTime(time));
    m_time->setX(-m_time->boundingRect().width() - HandleWidth / 2.0 - LabelPadding);
}

QFont DefaultPointMarker::labelFont() const
{
    QFont font(m_options.fontFamily);
    if (m_options.fontSize > 0) {
        font.setPixelSize(m_options.fontSize);
    }
    font.setBold(m_options.fontStyle.contains(QStringLiteral("bold"), Qt::CaseInsensitive));
    font.setItalic(m_options.fontStyle.contains(QStringLiteral("italic"), Qt::CaseInsensitive));
    return font;
}

QString DefaultPointMarker::formatTime(double time) const
{
    if (m_options.layer) {
        return m_options.layer->formatTime(time);
    }
    return QString::number(time, 'f', 2);
}

} // namespace ui
} // namespace waveview
