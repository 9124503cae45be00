#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QImage>
#include <QPainter>
#include "items/ItemLayer.h"
#include "items/ShapeItem.h"
#include "items/LineSegmentItem.h"

/**
 * @brief Tests for ItemLayer, the retained-mode drawing surface
 *
 * Covers:
 * - Id assignment and lookup
 * - Geometry mutations
 * - Nearest-item lookup within a halo
 * - Tagged text readouts
 * - One-shot scheduling
 */
class TestItemLayer : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Id tests
    void testIdsAreSequentialAndNeverReused();
    void testDeleteUnknownId();

    // Geometry tests
    void testMoveShape();
    void testSetItemRect_Shape();
    void testSetItemRect_LineRejected();
    void testScaleAboutAnchor();
    void testItemRect_UnknownIdIsNull();

    // Color tests
    void testFillColor_InvalidClears();

    // Hit testing
    void testFindClosest_InsideShape();
    void testFindClosest_OutsideHalo();
    void testFindClosest_PrefersNearest();
    void testFindClosest_IgnoresText();
    void testFindClosest_Line();

    // Text tests
    void testShowText_ReplacesSameTag();
    void testRemoveText();

    // Scheduling and painting
    void testScheduleOnce();
    void testChangedSignal();
    void testDraw();

private:
    ItemLayer* m_layer = nullptr;
};

void TestItemLayer::init()
{
    m_layer = new ItemLayer();
}

void TestItemLayer::cleanup()
{
    delete m_layer;
    m_layer = nullptr;
}

// ============================================================================
// Id Tests
// ============================================================================

void TestItemLayer::testIdsAreSequentialAndNeverReused()
{
    ItemId a = m_layer->createLine(QPointF(0, 0), QPointF(10, 0), Qt::black, 1);
    ItemId b = m_layer->createShape(ShapeKind::Oval, QRectF(0, 0, 20, 20), Qt::black, 1);
    QCOMPARE(b, a + 1);

    QVERIFY(m_layer->deleteItem(b));
    ItemId c = m_layer->createLine(QPointF(0, 0), QPointF(0, 10), Qt::black, 1);
    QVERIFY(c != b);
    QCOMPARE(m_layer->allItems(), QVector<ItemId>({a, c}));
}

void TestItemLayer::testDeleteUnknownId()
{
    QVERIFY(!m_layer->deleteItem(42));
    QVERIFY(!m_layer->contains(42));
    QVERIFY(!m_layer->moveItem(42, QPointF(1, 1)));
    QVERIFY(!m_layer->setFillColor(42, Qt::red));
}

// ============================================================================
// Geometry Tests
// ============================================================================

void TestItemLayer::testMoveShape()
{
    ItemId id = m_layer->createShape(ShapeKind::Rectangle, QRectF(10, 10, 20, 20), Qt::black, 1);
    QVERIFY(m_layer->moveItem(id, QPointF(5, -3)));
    QCOMPARE(m_layer->itemRect(id), QRectF(15, 7, 20, 20));
}

void TestItemLayer::testSetItemRect_Shape()
{
    ItemId id = m_layer->createShape(ShapeKind::Oval, QRectF(0, 0, 10, 10), Qt::black, 1);
    QVERIFY(m_layer->setItemRect(id, QRectF(-1, -1, 12, 12)));
    QCOMPARE(m_layer->itemRect(id), QRectF(-1, -1, 12, 12));
}

void TestItemLayer::testSetItemRect_LineRejected()
{
    ItemId id = m_layer->createLine(QPointF(0, 0), QPointF(10, 0), Qt::black, 1);
    QVERIFY(!m_layer->setItemRect(id, QRectF(0, 0, 5, 5)));
}

void TestItemLayer::testScaleAboutAnchor()
{
    ItemId id = m_layer->createShape(ShapeKind::Oval, QRectF(80, 75, 40, 50), Qt::black, 1);
    QVERIFY(m_layer->scaleItem(id, QPointF(100, 100), 2.0));

    QRectF rect = m_layer->itemRect(id);
    QCOMPARE(rect.center(), QPointF(100, 100));
    QCOMPARE(rect.size(), QSizeF(80, 100));
}

void TestItemLayer::testItemRect_UnknownIdIsNull()
{
    QVERIFY(m_layer->itemRect(7).isNull());
}

// ============================================================================
// Color Tests
// ============================================================================

void TestItemLayer::testFillColor_InvalidClears()
{
    ItemId id = m_layer->createShape(ShapeKind::Oval, QRectF(0, 0, 10, 10), Qt::black, 1);
    QVERIFY(!m_layer->fillColor(id).isValid());

    m_layer->setFillColor(id, Qt::yellow);
    QCOMPARE(m_layer->fillColor(id), QColor(Qt::yellow));

    m_layer->setFillColor(id, QColor());
    QVERIFY(!m_layer->fillColor(id).isValid());
}

// ============================================================================
// Hit Testing
// ============================================================================

void TestItemLayer::testFindClosest_InsideShape()
{
    ItemId id = m_layer->createShape(ShapeKind::Rectangle, QRectF(0, 0, 50, 50), Qt::black, 1);
    auto found = m_layer->findClosest(QPointF(25, 25), 0);
    QVERIFY(found.has_value());
    QCOMPARE(*found, id);
}

void TestItemLayer::testFindClosest_OutsideHalo()
{
    m_layer->createShape(ShapeKind::Rectangle, QRectF(0, 0, 50, 50), Qt::black, 1);
    QVERIFY(!m_layer->findClosest(QPointF(100, 25), 25).has_value());
    QVERIFY(m_layer->findClosest(QPointF(70, 25), 25).has_value());
}

void TestItemLayer::testFindClosest_PrefersNearest()
{
    m_layer->createShape(ShapeKind::Rectangle, QRectF(0, 0, 20, 20), Qt::black, 1);
    ItemId right = m_layer->createShape(ShapeKind::Rectangle, QRectF(40, 0, 20, 20), Qt::black, 1);

    auto found = m_layer->findClosest(QPointF(35, 10), 25);
    QVERIFY(found.has_value());
    QCOMPARE(*found, right);
}

void TestItemLayer::testFindClosest_IgnoresText()
{
    m_layer->showText(QStringLiteral("tag"), QPointF(10, 10), QStringLiteral("hello"), Qt::blue);
    QVERIFY(!m_layer->findClosest(QPointF(10, 10), 25).has_value());
}

void TestItemLayer::testFindClosest_Line()
{
    ItemId id = m_layer->createLine(QPointF(0, 0), QPointF(100, 0), Qt::black, 1);
    auto found = m_layer->findClosest(QPointF(50, 10), 25);
    QVERIFY(found.has_value());
    QCOMPARE(*found, id);
}

// ============================================================================
// Text Tests
// ============================================================================

void TestItemLayer::testShowText_ReplacesSameTag()
{
    m_layer->showText(QStringLiteral("cursor_text"), QPointF(0, 0), QStringLiteral("1,1"), Qt::blue);
    m_layer->showText(QStringLiteral("cursor_text"), QPointF(0, 0), QStringLiteral("2,2"), Qt::blue);

    QCOMPARE(m_layer->itemCount(), size_t(1));
    QCOMPARE(m_layer->text(QStringLiteral("cursor_text")), QStringLiteral("2,2"));
}

void TestItemLayer::testRemoveText()
{
    m_layer->showText(QStringLiteral("center_text"), QPointF(10, 12), QStringLiteral("5, 5"),
                      Qt::black, Qt::AlignLeft);
    m_layer->removeText(QStringLiteral("center_text"));

    QVERIFY(m_layer->isEmpty());
    QVERIFY(m_layer->text(QStringLiteral("center_text")).isEmpty());

    // Removing again is harmless
    m_layer->removeText(QStringLiteral("center_text"));
}

// ============================================================================
// Scheduling and Painting
// ============================================================================

void TestItemLayer::testScheduleOnce()
{
    int calls = 0;
    m_layer->scheduleOnce(10, [&calls]() { ++calls; });
    QCOMPARE(calls, 0);
    QTRY_COMPARE(calls, 1);
}

void TestItemLayer::testChangedSignal()
{
    QSignalSpy spy(m_layer, &ItemLayer::changed);
    ItemId id = m_layer->createLine(QPointF(0, 0), QPointF(1, 1), Qt::black, 1);
    m_layer->moveItem(id, QPointF(1, 0));
    m_layer->deleteItem(id);
    QCOMPARE(spy.count(), 3);
}

void TestItemLayer::testDraw()
{
    m_layer->createShape(ShapeKind::Arc, QRectF(10, 10, 60, 50), Qt::red, 2);
    m_layer->createLine(QPointF(0, 0), QPointF(99, 99), Qt::black, 1);

    QImage image(100, 100, QImage::Format_ARGB32);
    image.fill(Qt::white);
    QPainter painter(&image);
    m_layer->draw(painter);
    painter.end();

    QVERIFY(image.pixelColor(50, 50) != QColor(Qt::white));
}

QTEST_MAIN(TestItemLayer)
#include "tst_ItemLayer.moc"
