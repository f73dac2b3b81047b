#pragma once

#include "waveview/ui/Viewport.hpp"

namespace waveview {
namespace ui {

// Projection of a zoomable waveform: `scale` audio samples per pixel at
// `sampleRate` samples per second.
class ZoomViewport : public Viewport
{
public:
    explicit ZoomViewport(QString name = QStringLiteral("zoomview"));

    void setSampleRate(int sampleRate);
    void setScale(int samplesPerPixel);
    void setFrameOffset(double offset);
    void setSize(double width, double height);
    void setTimeLabelPrecision(int precision);

    int sampleRate() const { return m_sampleRate; }
    int scale() const { return m_scale; }

    QString name() const override;
    double startTime() const override;
    double endTime() const override;
    double frameOffset() const override;
    double width() const override;
    double height() const override;

    double timeToPixels(double time) const override;
    double pixelsToTime(double pixels) const override;
    double pixelOffsetToTime(double offset) const override;
    QString formatTime(double time) const override;

private:
    QString m_name;
    int m_sampleRate = 44100;
    int m_scale = 512;
    double m_frameOffset = 0.0;
    double m_width = 0.0;
    double m_height = 0.0;
    int m_timeLabelPrecision = 2;
};

} // namespace ui
} // namespace waveview
