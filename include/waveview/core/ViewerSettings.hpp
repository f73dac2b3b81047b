#pragma once

#include <QColor>
#include <QString>

class QSettings;

namespace waveview {
namespace core {

// Zoom limits, in audio samples per pixel.
constexpr int MinScale = 16;
constexpr int MaxScale = 8192;

// Host-level marker styling. Empty/zero fields mean "unset" so the points
// layer can fall back to its own defaults.
struct PointStyleOptions
{
    QColor markerColor = QColor(QStringLiteral("#39cccc"));
    QString fontFamily;
    int fontSize = 0;
    QString fontStyle;
};

struct ViewerSettings
{
    PointStyleOptions pointStyle;
    bool editable = true;
    int sampleRate = 44100;
    int scale = 512;
};

ViewerSettings loadViewerSettings(QSettings &settings);
void saveViewerSettings(QSettings &settings, const ViewerSettings &viewerSettings);

} // namespace core
} // namespace waveview
