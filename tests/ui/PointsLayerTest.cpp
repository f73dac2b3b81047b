#include <QGraphicsScene>
#include <QGraphicsSceneMouseEvent>
#include <QtTest/QtTest>
#include <algorithm>
#include <memory>

#include "ui/FakeMarkerFactory.hpp"
#include "waveview/core/EventBus.hpp"
#include "waveview/data/InMemoryPointRepository.hpp"
#include "waveview/ui/ZoomViewport.hpp"
#include "waveview/ui/layers/PointsLayer.hpp"
#include "waveview/ui/markers/PointMarker.hpp"

using namespace waveview;

namespace {

data::PointOptions pointAt(double time, const QString &id, bool editable = true)
{
    data::PointOptions options;
    options.time = time;
    options.id = id;
    options.editable = editable;
    return options;
}

// 100 px per second, 600 px wide: the window starts as [0, 6).
struct LayerFixture
{
    explicit LayerFixture(bool allowEditing = true, core::PointStyleOptions style = core::PointStyleOptions())
    {
        view.setSampleRate(100);
        view.setScale(1);
        view.setSize(600.0, 80.0);
        layer = std::make_unique<ui::PointsLayer>(bus, repo, view, factory, style, allowEditing);
    }

    void scrollTo(double frameOffset)
    {
        view.setFrameOffset(frameOffset);
        layer->synchronizeWindow(view.startTime(), view.endTime());
    }

    QStringList visibleIds(double startTime, double endTime) const
    {
        QStringList ids;
        for (const data::Point *point : repo.find(startTime, endTime)) {
            ids << point->id();
        }
        ids.sort();
        return ids;
    }

    core::EventBus bus;
    data::InMemoryPointRepository repo { bus };
    ui::ZoomViewport view;
    testing::FakeMarkerFactory factory;
    std::unique_ptr<ui::PointsLayer> layer;
};

} // namespace

class PointsLayerTest : public QObject
{
    Q_OBJECT

private slots:
    void scrollingKeepsSurvivingMarkers();
    void markersMatchVisiblePoints();
    void synchronizeIsIdempotent();
    void removeAllLeavesEmptyLayer();
    void updatedPointGetsFreshMarker();
    void reconcilePointsIsAdditive();
    void removingInvisiblePointIsNoop();
    void styleFallsBackToDefaults();
    void hostStyleIsUsedWhenSet();
    void editingNeedsLayerAndPoint();
    void destroyStopsListening();
    void dragInOtherViewRepositions();
    void fitToViewAndVisibility();
    void survivesSceneDeletion();
    void sceneDeletionAbandonsDrag();
    void updateResynchronizesWholeWindow();
    void addResynchronizesWholeWindow();
};

void PointsLayerTest::scrollingKeepsSurvivingMarkers()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(5.0, QStringLiteral("b")), pointAt(9.0, QStringLiteral("c")) });

    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("a"), QStringLiteral("b") }));
    ui::PointMarker *kept = f.layer->markerFor(QStringLiteral("b"));
    QVERIFY(kept);
    QCOMPARE(kept->x(), 500.0);
    QCOMPARE(f.factory.stats.created, 2);

    f.scrollTo(400.0);

    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("b"), QStringLiteral("c") }));
    QCOMPARE(f.layer->markerFor(QStringLiteral("b")), kept);
    QCOMPARE(kept->x(), 100.0);
    QCOMPARE(f.layer->markerFor(QStringLiteral("c"))->x(), 500.0);
    QCOMPARE(f.factory.stats.created, 3);
    QCOMPARE(f.factory.stats.destroyed, 1);
}

void PointsLayerTest::markersMatchVisiblePoints()
{
    LayerFixture f;
    f.repo.add({ pointAt(0.0, QStringLiteral("p0")),
                 pointAt(0.5, QStringLiteral("p1")),
                 pointAt(2.0, QStringLiteral("p2")),
                 pointAt(3.75, QStringLiteral("p3")),
                 pointAt(4.0, QStringLiteral("p4")),
                 pointAt(6.0, QStringLiteral("p5")),
                 pointAt(7.5, QStringLiteral("p6")),
                 pointAt(10.0, QStringLiteral("p7")) });

    const QList<QPair<double, double>> windows = {
        { 0.0, 6.0 }, { 4.0, 10.0 }, { 2.0, 4.0 }, { 6.0, 6.0 }, { 0.0, 100.0 }, { 3.75, 4.0 }, { 11.0, 20.0 },
    };
    for (const auto &window : windows) {
        f.layer->synchronizeWindow(window.first, window.second);
        QCOMPARE(f.layer->markerIds(), f.visibleIds(window.first, window.second));
        for (const QString &id : f.layer->markerIds()) {
            const data::Point *point = f.repo.findById(id);
            QCOMPARE(f.layer->markerFor(id)->x(), f.view.timeToPixels(point->time()) - f.view.frameOffset());
        }
    }
}

void PointsLayerTest::synchronizeIsIdempotent()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(5.0, QStringLiteral("b")), pointAt(9.0, QStringLiteral("c")) });
    f.scrollTo(250.0);

    const int created = f.factory.stats.created;
    const int destroyed = f.factory.stats.destroyed;
    const QStringList ids = f.layer->markerIds();
    const double x = f.layer->markerFor(QStringLiteral("b"))->x();

    f.layer->synchronizeWindow(f.view.startTime(), f.view.endTime());
    f.layer->synchronizeWindow(f.view.startTime(), f.view.endTime());

    QCOMPARE(f.factory.stats.created, created);
    QCOMPARE(f.factory.stats.destroyed, destroyed);
    QCOMPARE(f.layer->markerIds(), ids);
    QCOMPARE(f.layer->markerFor(QStringLiteral("b"))->x(), x);
}

void PointsLayerTest::removeAllLeavesEmptyLayer()
{
    QGraphicsScene scene;
    LayerFixture f;
    f.layer->addToScene(&scene);
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(2.0, QStringLiteral("b")), pointAt(3.0, QStringLiteral("c")) });
    QCOMPARE(f.layer->layerItem()->childItems().size(), 3);

    f.repo.removeAll();

    QCOMPARE(f.layer->markerCount(), std::size_t(0));
    QVERIFY(f.layer->layerItem()->childItems().isEmpty());
    QCOMPARE(scene.items().size(), 1);
    QCOMPARE(f.factory.stats.destroyed, f.factory.stats.created);

    f.layer->synchronizeWindow(0.0, 6.0);
    QCOMPARE(f.layer->markerCount(), std::size_t(0));
}

void PointsLayerTest::updatedPointGetsFreshMarker()
{
    LayerFixture f;
    f.repo.add({ pointAt(2.0, QStringLiteral("p")) });
    QCOMPARE(f.factory.stats.created, 1);

    data::PointOptions options;
    options.time = 3.0;
    QVERIFY(f.repo.update(QStringLiteral("p"), options));
    QCOMPARE(f.factory.stats.created, 2);
    QCOMPARE(f.factory.stats.destroyed, 1);
    QCOMPARE(f.layer->markerFor(QStringLiteral("p"))->x(), 300.0);

    options.time = 8.0;
    QVERIFY(f.repo.update(QStringLiteral("p"), options));
    QVERIFY(!f.layer->markerFor(QStringLiteral("p")));
    QCOMPARE(f.factory.stats.destroyed, 2);

    options.time = 1.0;
    QVERIFY(f.repo.update(QStringLiteral("p"), options));
    QCOMPARE(f.layer->markerFor(QStringLiteral("p"))->x(), 100.0);
}

void PointsLayerTest::reconcilePointsIsAdditive()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(2.0, QStringLiteral("b")) });
    ui::PointMarker *first = f.layer->markerFor(QStringLiteral("a"));

    f.layer->reconcilePoints(f.repo.points());
    QCOMPARE(f.factory.stats.created, 2);
    QCOMPARE(f.layer->markerFor(QStringLiteral("a")), first);

    f.repo.add({ pointAt(7.0, QStringLiteral("late")) });
    QCOMPARE(f.factory.stats.created, 2);
    QCOMPARE(f.layer->markerCount(), std::size_t(2));
}

void PointsLayerTest::removingInvisiblePointIsNoop()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(9.0, QStringLiteral("c")) });

    QCOMPARE(f.repo.removeById(QStringLiteral("c")), std::size_t(1));
    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("a") }));
    QCOMPARE(f.factory.stats.destroyed, 0);

    QCOMPARE(f.repo.removeById(QStringLiteral("a")), std::size_t(1));
    QCOMPARE(f.layer->markerCount(), std::size_t(0));
    QCOMPARE(f.factory.stats.destroyed, 1);
}

void PointsLayerTest::styleFallsBackToDefaults()
{
    LayerFixture f;
    data::PointOptions colored = pointAt(2.0, QStringLiteral("colored"));
    colored.color = QColor(Qt::red);
    f.repo.add({ pointAt(1.0, QStringLiteral("plain")), colored });

    QCOMPARE(f.factory.stats.options.size(), std::size_t(2));
    const auto &plain = f.factory.stats.options[0];
    QCOMPARE(plain.point, f.repo.findById(QStringLiteral("plain")));
    QCOMPARE(plain.color, QColor(QStringLiteral("#39cccc")));
    QCOMPARE(plain.fontFamily, QStringLiteral("sans-serif"));
    QCOMPARE(plain.fontSize, 10);
    QCOMPARE(plain.fontStyle, QStringLiteral("normal"));
    QCOMPARE(plain.view, QStringLiteral("zoomview"));
    QVERIFY(plain.layer == f.layer.get());

    QCOMPARE(f.factory.stats.options[1].color, QColor(Qt::red));
}

void PointsLayerTest::hostStyleIsUsedWhenSet()
{
    core::PointStyleOptions style;
    style.markerColor = QColor(Qt::blue);
    style.fontFamily = QStringLiteral("Monospace");
    style.fontSize = 14;
    style.fontStyle = QStringLiteral("italic");
    LayerFixture f(true, style);
    f.repo.add({ pointAt(1.0, QStringLiteral("p")) });

    const auto &options = f.factory.stats.options.front();
    QCOMPARE(options.color, QColor(Qt::blue));
    QCOMPARE(options.fontFamily, QStringLiteral("Monospace"));
    QCOMPARE(options.fontSize, 14);
    QCOMPARE(options.fontStyle, QStringLiteral("italic"));
}

void PointsLayerTest::editingNeedsLayerAndPoint()
{
    LayerFixture f(false);
    f.repo.add({ pointAt(1.0, QStringLiteral("open")), pointAt(2.0, QStringLiteral("locked"), false) });

    QVERIFY(!f.factory.stats.options[0].draggable);
    QVERIFY(!f.layer->markerFor(QStringLiteral("open"))->isDraggable());

    f.layer->enableEditing(true);
    QVERIFY(f.layer->isEditingEnabled());
    QCOMPARE(f.factory.stats.created, 4);
    QVERIFY(f.layer->markerFor(QStringLiteral("open"))->isDraggable());
    QVERIFY(!f.layer->markerFor(QStringLiteral("locked"))->isDraggable());

    // Same flag again is not a rebuild.
    f.layer->enableEditing(true);
    QCOMPARE(f.factory.stats.created, 4);
}

void PointsLayerTest::destroyStopsListening()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")) });

    f.layer->destroy();
    QCOMPARE(f.layer->markerCount(), std::size_t(0));
    QCOMPARE(f.factory.stats.destroyed, 1);

    f.repo.add({ pointAt(2.0, QStringLiteral("b")) });
    QCOMPARE(f.factory.stats.created, 1);
    QCOMPARE(f.layer->markerCount(), std::size_t(0));
}

void PointsLayerTest::dragInOtherViewRepositions()
{
    LayerFixture f;
    f.repo.add({ pointAt(2.0, QStringLiteral("p")) });
    data::Point *point = f.repo.findById(QStringLiteral("p"));

    point->setTime(3.0);
    emit f.bus.pointDragMoved(core::PointEvent { point, core::PointerEvent() });
    QCOMPARE(f.layer->markerFor(QStringLiteral("p"))->x(), 300.0);
    QCOMPARE(f.factory.stats.created, 1);

    point->setTime(8.0);
    emit f.bus.pointDragMoved(core::PointEvent { point, core::PointerEvent() });
    QVERIFY(!f.layer->markerFor(QStringLiteral("p")));

    point->setTime(4.0);
    emit f.bus.pointDragEnded(core::PointEvent { point, core::PointerEvent() });
    QCOMPARE(f.layer->markerFor(QStringLiteral("p"))->x(), 400.0);
}

void PointsLayerTest::fitToViewAndVisibility()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(2.0, QStringLiteral("b")) });

    f.view.setSize(600.0, 140.0);
    f.layer->fitToView();
    QCOMPARE(f.factory.stats.fitted, 2);
    QCOMPARE(f.factory.stats.lastHeight, 140.0);
    QCOMPARE(f.layer->height(), 140.0);
    QCOMPARE(f.layer->formatTime(65.5), QStringLiteral("01:05.50"));

    QVERIFY(f.layer->isVisible());
    f.layer->setVisible(false);
    QVERIFY(!f.layer->isVisible());
    QVERIFY(!f.layer->markerFor(QStringLiteral("a"))->isVisible());
}

void PointsLayerTest::survivesSceneDeletion()
{
    LayerFixture f;
    auto *scene = new QGraphicsScene;
    f.layer->addToScene(scene);
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(2.0, QStringLiteral("b")) });
    f.layer->setVisible(false);

    delete scene;
    QCOMPARE(f.factory.stats.destroyed, 2);
    QCOMPARE(f.layer->markerCount(), std::size_t(0));
    QVERIFY(!f.layer->layerItem()->scene());
    QVERIFY(!f.layer->isVisible());

    // The store keeps publishing; the layer rebuilds under its detached item.
    f.repo.add({ pointAt(3.0, QStringLiteral("c")) });
    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c") }));
    QCOMPARE(f.layer->layerItem()->childItems().size(), 3);

    f.scrollTo(150.0);
    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("b"), QStringLiteral("c") }));
    QCOMPARE(f.layer->markerFor(QStringLiteral("c"))->x(), 150.0);

    f.repo.removeAll();
    QCOMPARE(f.layer->markerCount(), std::size_t(0));
    QVERIFY(f.layer->layerItem()->childItems().isEmpty());
    QCOMPARE(f.factory.stats.destroyed, f.factory.stats.created);

    QGraphicsScene other;
    f.layer->addToScene(&other);
    f.repo.add({ pointAt(4.0, QStringLiteral("d")) });
    QCOMPARE(f.layer->layerItem()->scene(), &other);
    QCOMPARE(f.layer->markerFor(QStringLiteral("d"))->scene(), &other);

    f.layer.reset();
    QCOMPARE(other.items().size(), 0);
    QCOMPARE(f.factory.stats.destroyed, f.factory.stats.created);
}

void PointsLayerTest::sceneDeletionAbandonsDrag()
{
    LayerFixture f;
    auto *scene = new QGraphicsScene;
    f.layer->addToScene(scene);
    f.repo.add({ pointAt(2.0, QStringLiteral("p")) });
    ui::PointMarker *marker = f.layer->markerFor(QStringLiteral("p"));
    QVERIFY(marker);

    const QPointF press(200.0, 10.0);
    QGraphicsSceneMouseEvent pressEvent(QEvent::GraphicsSceneMousePress);
    pressEvent.setScenePos(press);
    pressEvent.setButton(Qt::LeftButton);
    pressEvent.setButtons(Qt::LeftButton);
    scene->sendEvent(marker, &pressEvent);
    QGraphicsSceneMouseEvent moveEvent(QEvent::GraphicsSceneMouseMove);
    moveEvent.setScenePos(QPointF(260.0, 10.0));
    moveEvent.setButtons(Qt::LeftButton);
    scene->sendEvent(marker, &moveEvent);
    QVERIFY(f.layer->dragController().isDragging());

    delete scene;
    QVERIFY(!f.layer->dragController().isDragging());

    data::PointOptions options;
    options.time = 2.5;
    QVERIFY(f.repo.update(QStringLiteral("p"), options));
    QCOMPARE(f.layer->markerFor(QStringLiteral("p"))->x(), 250.0);
}

void PointsLayerTest::updateResynchronizesWholeWindow()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(5.0, QStringLiteral("b")) });
    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("a"), QStringLiteral("b") }));

    // Scroll without syncing: a is now out of the window and b is stale.
    f.view.setFrameOffset(200.0);
    QCOMPARE(f.layer->markerFor(QStringLiteral("b"))->x(), 500.0);

    data::PointOptions options;
    options.labelText = QStringLiteral("Bridge");
    QVERIFY(f.repo.update(QStringLiteral("b"), options));

    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("b") }));
    QCOMPARE(f.layer->markerFor(QStringLiteral("b"))->x(), f.view.timeToPixels(5.0) - f.view.frameOffset());
    QCOMPARE(f.layer->markerFor(QStringLiteral("b"))->x(), 300.0);
}

void PointsLayerTest::addResynchronizesWholeWindow()
{
    LayerFixture f;
    f.repo.add({ pointAt(1.0, QStringLiteral("a")), pointAt(5.0, QStringLiteral("b")) });
    ui::PointMarker *kept = f.layer->markerFor(QStringLiteral("b"));

    f.view.setFrameOffset(200.0);
    f.repo.add({ pointAt(7.0, QStringLiteral("c")) });

    QCOMPARE(f.layer->markerIds(), QStringList({ QStringLiteral("b"), QStringLiteral("c") }));
    QCOMPARE(f.layer->markerFor(QStringLiteral("b")), kept);
    QCOMPARE(kept->x(), 300.0);
    QCOMPARE(f.layer->markerFor(QStringLiteral("c"))->x(), 500.0);
    QCOMPARE(f.factory.stats.destroyed, 1);
}

QTEST_MAIN(PointsLayerTest)
#include "PointsLayerTest.moc"
