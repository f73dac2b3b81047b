#include "waveview/ui/layers/PointsLayer.hpp"

#include <QGraphicsItem>
#include <QGraphicsScene>
#include <utility>

#include "waveview/core/Logging.hpp"
#include "waveview/data/Point.hpp"
#include "waveview/data/PointRepository.hpp"
#include "waveview/ui/Viewport.hpp"
#include "waveview/ui/markers/Marker.hpp"
#include "waveview/ui/markers/PointMarker.hpp"
#include "waveview/ui/markers/PointMarkerFactory.hpp"

namespace waveview {
namespace ui {

namespace {

const QString DefaultFontFamily = QStringLiteral("sans-serif");
constexpr int DefaultFontSize = 10;
const QString DefaultFontStyle = QStringLiteral("normal");

// Parent item for all markers of one layer. Draws nothing itself.
class LayerItem : public QGraphicsItem
{
public:
    LayerItem() { setFlag(QGraphicsItem::ItemHasNoContents, true); }

    QRectF boundingRect() const override { return {}; }
    void paint(QPainter *, const QStyleOptionGraphicsItem *, QWidget *) override {}
};

} // namespace

PointsLayer::PointsLayer(core::EventBus &bus,
                         data::PointRepository &points,
                         const Viewport &view,
                         PointMarkerFactory &factory,
                         core::PointStyleOptions style,
                         bool allowEditing,
                         QObject *parent)
    : QObject(parent)
    , m_bus(bus)
    , m_points(points)
    , m_view(view)
    , m_factory(factory)
    , m_style(std::move(style))
    , m_allowEditing(allowEditing)
    , m_layer(std::make_unique<LayerItem>())
    , m_dragController(bus, view)
    , m_forwarder(bus)
{
    subscribe();
}

PointsLayer::~PointsLayer()
{
    destroy();
    if (m_scene) {
        QObject::disconnect(m_sceneDestroyed);
        m_scene->removeItem(m_layer.get());
    }
}

void PointsLayer::addToScene(QGraphicsScene *scene)
{
    if (!scene || m_scene == scene) {
        return;
    }
    if (m_scene) {
        QObject::disconnect(m_sceneDestroyed);
        m_scene->removeItem(m_layer.get());
    }
    scene->addItem(m_layer.get());
    m_scene = scene;
    m_sceneDestroyed = connect(scene, &QObject::destroyed, this, &PointsLayer::onSceneDestroyed);
}

void PointsLayer::enableEditing(bool enable)
{
    if (m_allowEditing == enable) {
        return;
    }
    m_allowEditing = enable;
    // Draggability is fixed when a marker is built, so rebuild them.
    removeAllPoints();
    synchronizeWindow(m_view.startTime(), m_view.endTime());
}

void PointsLayer::setVisible(bool visible)
{
    m_visible = visible;
    m_layer->setVisible(visible);
}

bool PointsLayer::isVisible() const
{
    return m_layer->isVisible();
}

void PointsLayer::draw()
{
    for (PointMarker *marker : std::as_const(m_pointMarkers)) {
        marker->update();
    }
}

void PointsLayer::fitToView()
{
    const double viewHeight = m_view.height();
    for (PointMarker *marker : std::as_const(m_pointMarkers)) {
        marker->fitToView(viewHeight);
    }
}

void PointsLayer::destroy()
{
    for (const auto &connection : m_subscriptions) {
        QObject::disconnect(connection);
    }
    m_subscriptions.clear();
    removeAllPoints();
}

QString PointsLayer::formatTime(double time) const
{
    return m_view.formatTime(time);
}

double PointsLayer::height() const
{
    return m_view.height();
}

void PointsLayer::reconcilePoint(data::Point &point)
{
    const double frameStartTime = m_view.startTime();
    const double frameEndTime = m_view.endTime();

    removePoint(point);

    if (point.isVisible(frameStartTime, frameEndTime)) {
        addPointMarker(point);
    }

    synchronizeWindow(frameStartTime, frameEndTime);
}

void PointsLayer::reconcilePoints(const std::vector<data::Point *> &points)
{
    const double frameStartTime = m_view.startTime();
    const double frameEndTime = m_view.endTime();

    for (data::Point *point : points) {
        if (point->isVisible(frameStartTime, frameEndTime) && !m_pointMarkers.contains(point->id())) {
            addPointMarker(*point);
        }
    }

    synchronizeWindow(frameStartTime, frameEndTime);
}

void PointsLayer::removePoints(const std::vector<data::Point *> &points)
{
    for (const data::Point *point : points) {
        removePoint(*point);
    }
}

void PointsLayer::removeAllPoints()
{
    const auto markers = m_pointMarkers.values();
    m_pointMarkers.clear();
    for (PointMarker *marker : markers) {
        deleteMarker(marker);
    }
}

void PointsLayer::synchronizeWindow(double startTime, double endTime)
{
    const auto points = m_points.find(startTime, endTime);
    for (data::Point *point : points) {
        updatePoint(*point);
    }

    const int removed = removeInvisiblePoints(startTime, endTime);
    qCDebug(waveviewPoints) << m_view.name() << "window" << startTime << endTime << ":" << m_pointMarkers.size()
                            << "markers," << removed << "removed";
}

PointMarker *PointsLayer::markerFor(const QString &pointId) const
{
    return m_pointMarkers.value(pointId, nullptr);
}

QStringList PointsLayer::markerIds() const
{
    QStringList ids = m_pointMarkers.keys();
    ids.sort();
    return ids;
}

void PointsLayer::subscribe()
{
    m_subscriptions.push_back(connect(&m_bus, &core::EventBus::pointUpdated, this,
                                      [this](data::Point *point, const data::PointOptions &) {
                                          reconcilePoint(*point);
                                      }));
    m_subscriptions.push_back(connect(&m_bus, &core::EventBus::pointsAdded, this, &PointsLayer::reconcilePoints));
    m_subscriptions.push_back(connect(&m_bus, &core::EventBus::pointsRemoved, this, &PointsLayer::removePoints));
    m_subscriptions.push_back(
        connect(&m_bus, &core::EventBus::allPointsRemoved, this, &PointsLayer::removeAllPoints));

    m_subscriptions.push_back(connect(&m_bus, &core::EventBus::pointDragStarted, this, &PointsLayer::onPointsDrag));
    m_subscriptions.push_back(connect(&m_bus, &core::EventBus::pointDragMoved, this, &PointsLayer::onPointsDrag));
    m_subscriptions.push_back(connect(&m_bus, &core::EventBus::pointDragEnded, this, &PointsLayer::onPointsDrag));
}

void PointsLayer::onPointsDrag(const core::PointEvent &event)
{
    if (!event.point) {
        return;
    }
    const auto &session = m_dragController.session();
    const bool draggedHere = session && session->point == event.point;
    if (draggedHere || event.point->isVisible(m_view.startTime(), m_view.endTime())) {
        updatePoint(*event.point);
    } else {
        removePoint(*event.point);
    }
}

void PointsLayer::onSceneDestroyed()
{
    // ~QGraphicsScene has already deleted the layer item and every marker
    // under it. Forget them and carry on with a detached item.
    QGraphicsItem *deletedByScene = m_layer.release();
    Q_UNUSED(deletedByScene);
    m_pointMarkers.clear();
    m_dragController.reset();
    m_scene = nullptr;
    m_layer = std::make_unique<LayerItem>();
    m_layer->setVisible(m_visible);
    qCDebug(waveviewPoints) << m_view.name() << "scene destroyed, layer detached";
}

PointMarker *PointsLayer::createPointMarker(data::Point &point)
{
    const bool editable = m_allowEditing && point.editable();

    PointMarkerOptions options;
    options.point = &point;
    options.draggable = editable;
    options.color = point.color().isValid() ? point.color() : m_style.markerColor;
    options.fontFamily = m_style.fontFamily.isEmpty() ? DefaultFontFamily : m_style.fontFamily;
    options.fontSize = m_style.fontSize > 0 ? m_style.fontSize : DefaultFontSize;
    options.fontStyle = m_style.fontStyle.isEmpty() ? DefaultFontStyle : m_style.fontStyle;
    options.layer = this;
    options.view = m_view.name();

    auto *marker = new PointMarker(point, editable, m_factory.createPointMarker(options), m_layer.get());
    marker->setDragBoundFunc([this](const PointMarker &target, const QPointF &scenePos) {
        return m_dragController.dragBound(target, scenePos);
    });

    connect(marker, &PointMarker::clicked, this, [this, marker](const core::PointerEvent &evt) {
        m_forwarder.click(marker->point(), evt);
    });
    connect(marker, &PointMarker::doubleClicked, this, [this, marker](const core::PointerEvent &evt) {
        m_forwarder.doubleClick(marker->point(), evt);
    });
    connect(marker, &PointMarker::mouseEntered, this, [this, marker](const core::PointerEvent &evt) {
        m_forwarder.mouseEnter(marker->point(), evt);
    });
    connect(marker, &PointMarker::mouseLeft, this, [this, marker](const core::PointerEvent &evt) {
        m_forwarder.mouseLeave(marker->point(), evt);
    });
    connect(marker, &PointMarker::contextMenuRequested, this, [this, marker](const core::PointerEvent &evt) {
        m_forwarder.contextMenu(marker->point(), evt);
    });
    connect(marker, &PointMarker::dragStarted, this, [this, marker](const core::PointerEvent &evt) {
        m_dragController.dragStart(*marker, evt);
    });
    connect(marker, &PointMarker::dragMoved, this, [this, marker](const core::PointerEvent &evt) {
        m_dragController.dragMove(*marker, evt);
    });
    connect(marker, &PointMarker::dragEnded, this, [this, marker](const core::PointerEvent &evt) {
        m_dragController.dragEnd(*marker, evt);
    });

    return marker;
}

PointMarker *PointsLayer::addPointMarker(data::Point &point)
{
    PointMarker *marker = createPointMarker(point);
    m_pointMarkers.insert(point.id(), marker);
    return marker;
}

PointMarker *PointsLayer::findOrAddPointMarker(data::Point &point)
{
    PointMarker *marker = m_pointMarkers.value(point.id(), nullptr);
    if (!marker) {
        marker = addPointMarker(point);
    }
    return marker;
}

void PointsLayer::updatePoint(data::Point &point)
{
    PointMarker *marker = findOrAddPointMarker(point);
    const double markerX = m_view.timeToPixels(point.time()) - m_view.frameOffset();
    marker->setX(markerX);
}

int PointsLayer::removeInvisiblePoints(double startTime, double endTime)
{
    int count = 0;
    const auto markers = m_pointMarkers.values();
    for (PointMarker *marker : markers) {
        const data::Point &point = marker->point();
        if (!point.isVisible(startTime, endTime)) {
            removePoint(point);
            ++count;
        }
    }
    return count;
}

void PointsLayer::removePoint(const data::Point &point)
{
    PointMarker *marker = m_pointMarkers.take(point.id());
    if (marker) {
        deleteMarker(marker);
    }
}

void PointsLayer::deleteMarker(PointMarker *marker)
{
    m_dragController.forget(*marker);
    delete marker;
}

} // namespace ui
} // namespace waveview
