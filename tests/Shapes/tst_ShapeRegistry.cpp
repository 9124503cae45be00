#include <QtTest/QtTest>
#include "shapes/ShapeRegistry.h"

class TestShapeRegistry : public QObject
{
    Q_OBJECT

private slots:
    void testEmpty();
    void testAddAndFind();
    void testLast_IsNewest();
    void testRemove();
    void testRemove_Unknown();
    void testFind_MutableUpdatesRecord();
    void testShapeKindNames();

private:
    static Shape makeShape(ItemId id, const QPointF &center);
};

Shape TestShapeRegistry::makeShape(ItemId id, const QPointF &center)
{
    Shape shape;
    shape.id = id;
    shape.kind = ShapeKind::Oval;
    shape.center = center;
    shape.outlineColor = Qt::black;
    return shape;
}

void TestShapeRegistry::testEmpty()
{
    ShapeRegistry registry;
    QVERIFY(registry.isEmpty());
    QVERIFY(registry.last() == nullptr);
    QVERIFY(registry.find(1) == nullptr);
}

void TestShapeRegistry::testAddAndFind()
{
    ShapeRegistry registry;
    registry.add(makeShape(3, QPointF(10, 10)));
    registry.add(makeShape(7, QPointF(20, 20)));

    QCOMPARE(registry.size(), 2);
    QVERIFY(registry.contains(7));
    QCOMPARE(registry.find(3)->center, QPointF(10, 10));
    QCOMPARE(registry.ids(), QVector<ItemId>({3, 7}));
}

void TestShapeRegistry::testLast_IsNewest()
{
    ShapeRegistry registry;
    registry.add(makeShape(1, QPointF()));
    registry.add(makeShape(2, QPointF()));
    QCOMPARE(registry.last()->id, 2);

    registry.remove(2);
    QCOMPARE(registry.last()->id, 1);
}

void TestShapeRegistry::testRemove()
{
    ShapeRegistry registry;
    registry.add(makeShape(1, QPointF()));
    registry.add(makeShape(2, QPointF()));
    registry.add(makeShape(3, QPointF()));

    QVERIFY(registry.remove(2));
    QCOMPARE(registry.ids(), QVector<ItemId>({1, 3}));
}

void TestShapeRegistry::testRemove_Unknown()
{
    ShapeRegistry registry;
    registry.add(makeShape(1, QPointF()));
    QVERIFY(!registry.remove(5));
    QCOMPARE(registry.size(), 1);
}

void TestShapeRegistry::testFind_MutableUpdatesRecord()
{
    ShapeRegistry registry;
    registry.add(makeShape(1, QPointF(0, 0)));

    Shape *shape = registry.find(1);
    QVERIFY(shape);
    shape->outlineColor = Qt::red;
    QCOMPARE(registry.shapes().first().outlineColor, QColor(Qt::red));
}

void TestShapeRegistry::testShapeKindNames()
{
    QCOMPARE(ShapeKinds::name(ShapeKind::Arc), QStringLiteral("arc"));
    QVERIFY(ShapeKinds::isValid(2));
    QVERIFY(!ShapeKinds::isValid(3));
    QVERIFY(!ShapeKinds::isValid(-1));
    QCOMPARE(ShapeKinds::defaultHalfSize(ShapeKind::Rectangle), QSize(25, 20));
}

QTEST_MAIN(TestShapeRegistry)
#include "tst_ShapeRegistry.moc"
