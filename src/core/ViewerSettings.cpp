#include "waveview/core/ViewerSettings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace waveview {
namespace core {

ViewerSettings loadViewerSettings(QSettings &settings)
{
    ViewerSettings result;

    const QColor storedColor(settings.value(QStringLiteral("points/markerColor")).toString());
    if (storedColor.isValid()) {
        result.pointStyle.markerColor = storedColor;
    }
    result.pointStyle.fontFamily = settings.value(QStringLiteral("points/fontFamily")).toString();
    result.pointStyle.fontSize = qMax(0, settings.value(QStringLiteral("points/fontSize"), 0).toInt());
    result.pointStyle.fontStyle = settings.value(QStringLiteral("points/fontStyle")).toString();
    result.editable = settings.value(QStringLiteral("points/editable"), result.editable).toBool();

    const int storedRate = settings.value(QStringLiteral("view/sampleRate"), result.sampleRate).toInt();
    if (storedRate > 0) {
        result.sampleRate = storedRate;
    }
    const int storedScale = settings.value(QStringLiteral("view/scale"), result.scale).toInt();
    result.scale = qBound(MinScale, storedScale, MaxScale);
    return result;
}

void saveViewerSettings(QSettings &settings, const ViewerSettings &viewerSettings)
{
    settings.setValue(QStringLiteral("points/markerColor"), viewerSettings.pointStyle.markerColor.name());
    settings.setValue(QStringLiteral("points/fontFamily"), viewerSettings.pointStyle.fontFamily);
    settings.setValue(QStringLiteral("points/fontSize"), viewerSettings.pointStyle.fontSize);
    settings.setValue(QStringLiteral("points/fontStyle"), viewerSettings.pointStyle.fontStyle);
    settings.setValue(QStringLiteral("points/editable"), viewerSettings.editable);
    settings.setValue(QStringLiteral("view/sampleRate"), viewerSettings.sampleRate);
    settings.setValue(QStringLiteral("view/scale"), viewerSettings.scale);
}

} // namespace core
} // namespace waveview
