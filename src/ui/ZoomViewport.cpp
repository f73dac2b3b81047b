#include "waveview/ui/ZoomViewport.hpp"

#include <QStringList>
#include <QtGlobal>
#include <cmath>
#include <utility>

namespace waveview {
namespace ui {

ZoomViewport::ZoomViewport(QString name)
    : m_name(std::move(name))
{
}

void ZoomViewport::setSampleRate(int sampleRate)
{
    if (sampleRate <= 0) {
        return;
    }
    m_sampleRate = sampleRate;
}

void ZoomViewport::setScale(int samplesPerPixel)
{
    if (samplesPerPixel <= 0) {
        return;
    }
    m_scale = samplesPerPixel;
}

void ZoomViewport::setFrameOffset(double offset)
{
    m_frameOffset = qMax(0.0, offset);
}

void ZoomViewport::setSize(double width, double height)
{
    m_width = qMax(0.0, width);
    m_height = qMax(0.0, height);
}

void ZoomViewport::setTimeLabelPrecision(int precision)
{
    m_timeLabelPrecision = qBound(0, precision, 3);
}

QString ZoomViewport::name() const
{
    return m_name;
}

double ZoomViewport::startTime() const
{
    return pixelsToTime(m_frameOffset);
}

double ZoomViewport::endTime() const
{
    return pixelsToTime(m_frameOffset + m_width);
}

double ZoomViewport::frameOffset() const
{
    return m_frameOffset;
}

double ZoomViewport::width() const
{
    return m_width;
}

double ZoomViewport::height() const
{
    return m_height;
}

double ZoomViewport::timeToPixels(double time) const
{
    return std::floor(time * m_sampleRate / m_scale);
}

double ZoomViewport::pixelsToTime(double pixels) const
{
    return pixels * m_scale / m_sampleRate;
}

double ZoomViewport::pixelOffsetToTime(double offset) const
{
    return pixelsToTime(offset + m_frameOffset);
}

QString ZoomViewport::formatTime(double time) const
{
    // [hh:]mm:ss[.ff]
    const double wholeSeconds = std::floor(time);
    const int fraction = static_cast<int>(std::floor((time - wholeSeconds) * std::pow(10.0, m_timeLabelPrecision)));
    const long long total = static_cast<long long>(wholeSeconds);
    const long long hours = total / 3600;
    const long long minutes = (total / 60) % 60;
    const long long seconds = total % 60;

    QStringList parts;
    if (hours > 0) {
        parts << QStringLiteral("%1").arg(hours, 2, 10, QLatin1Char('0'));
    }
    parts << QStringLiteral("%1").arg(minutes, 2, 10, QLatin1Char('0'));
    parts << QStringLiteral("%1").arg(seconds, 2, 10, QLatin1Char('0'));

    QString result = parts.join(QLatin1Char(':'));
    if (m_timeLabelPrecision > 0) {
        result += QLatin1Char('.') + QStringLiteral("%1").arg(fraction, m_timeLabelPrecision, 10, QLatin1Char('0'));
    }
    return result;
}

} // namespace ui
} // namespace waveview
