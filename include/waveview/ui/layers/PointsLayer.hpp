#pragma once

#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

#include "waveview/core/EventBus.hpp"
#include "waveview/core/ViewerSettings.hpp"
#include "waveview/ui/interaction/PointDragController.hpp"
#include "waveview/ui/interaction/PointEventForwarder.hpp"

class QGraphicsItem;
class QGraphicsScene;

namespace waveview {
namespace data {
class Point;
class PointRepository;
}

namespace ui {

class PointMarker;
class PointMarkerFactory;
class Viewport;

// Keeps one PointMarker per point that falls inside the view's visible
// window, in step with the point store and with scrolling. Markers live
// under a single scene item that is attached with addToScene(). If the
// scene is deleted first, the layer drops its markers and keeps working
// with a detached item.
class PointsLayer : public QObject
{
    Q_OBJECT

public:
    PointsLayer(core::EventBus &bus,
                data::PointRepository &points,
                const Viewport &view,
                PointMarkerFactory &factory,
                core::PointStyleOptions style,
                bool allowEditing,
                QObject *parent = nullptr);
    ~PointsLayer() override;

    void addToScene(QGraphicsScene *scene);
    void enableEditing(bool enable);
    bool isEditingEnabled() const { return m_allowEditing; }
    void setVisible(bool visible);
    bool isVisible() const;
    void draw();
    void fitToView();
    // Unsubscribes from the bus and releases every marker.
    void destroy();

    QString formatTime(double time) const;
    double height() const;

    // Replaces the point's marker with a fresh one if the point is visible,
    // then re-synchronizes the whole window.
    void reconcilePoint(data::Point &point);
    // Adds markers for visible points that have none, then re-synchronizes.
    void reconcilePoints(const std::vector<data::Point *> &points);
    void removePoints(const std::vector<data::Point *> &points);
    void removeAllPoints();
    // Ensures and positions a marker for every point in the window, then
    // drops markers whose point left it.
    void synchronizeWindow(double startTime, double endTime);

    std::size_t markerCount() const { return static_cast<std::size_t>(m_pointMarkers.size()); }
    PointMarker *markerFor(const QString &pointId) const;
    QStringList markerIds() const;
    QGraphicsItem *layerItem() const { return m_layer.get(); }
    const PointDragController &dragController() const { return m_dragController; }

private:
    void subscribe();
    void onPointsDrag(const core::PointEvent &event);
    void onSceneDestroyed();
    PointMarker *createPointMarker(data::Point &point);
    PointMarker *addPointMarker(data::Point &point);
    PointMarker *findOrAddPointMarker(data::Point &point);
    void updatePoint(data::Point &point);
    int removeInvisiblePoints(double startTime, double endTime);
    void removePoint(const data::Point &point);
    void deleteMarker(PointMarker *marker);

    core::EventBus &m_bus;
    data::PointRepository &m_points;
    const Viewport &m_view;
    PointMarkerFactory &m_factory;
    core::PointStyleOptions m_style;
    bool m_allowEditing = false;

    std::unique_ptr<QGraphicsItem> m_layer;
    QPointer<QGraphicsScene> m_scene;
    QMetaObject::Connection m_sceneDestroyed;
    bool m_visible = true;
    QHash<QString, PointMarker *> m_pointMarkers;
    std::vector<QMetaObject::Connection> m_subscriptions;

    PointDragController m_dragController;
    PointEventForwarder m_forwarder;
};

} // namespace ui
} // namespace waveview
