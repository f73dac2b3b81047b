#pragma once

#include <QString>

namespace waveview {
namespace ui {

// Time/pixel projection of a waveform view. Pixel offsets are relative to
// the left edge of the visible frame; absolute pixels include the frame
// offset.
class Viewport
{
public:
    virtual ~Viewport() = default;

    virtual QString name() const = 0;
    virtual double startTime() const = 0;
    virtual double endTime() const = 0;
    virtual double frameOffset() const = 0;
    virtual double width() const = 0;
    virtual double height() const = 0;

    virtual double timeToPixels(double time) const = 0;
    virtual double pixelsToTime(double pixels) const = 0;
    virtual double pixelOffsetToTime(double offset) const = 0;
    virtual QString formatTime(double time) const = 0;
};

} // namespace ui
} // namespace waveview
