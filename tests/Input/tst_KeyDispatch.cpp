#include <QtTest/QtTest>
#include "input/KeyDispatch.h"
#include "input/ModifierState.h"
#include "canvas/CanvasRegistry.h"
#include "items/ItemLayer.h"
#include "shapes/ShapeController.h"
#include "tools/DrawController.h"

Q_DECLARE_METATYPE(KeyAction)

/**
 * @brief Tests for keyboard decoding and routing
 */
class TestKeyDispatch : public QObject
{
    Q_OBJECT

private slots:
    // Decoding
    void testResolve_data();
    void testResolve();
    void testResolve_CapsLockVariants();
    void testResolve_Uppercase();
    void testKeysymFromQt();

    // Routing
    void testApply_NoneOrNoRegistry();
    void testApply_NudgeRoutesToActiveShapeCanvas();
    void testApply_ShapeCommandWithoutShapeCanvas();
    void testApply_EraseAllScopedToMode();
    void testApply_NextShapeKind();
};

void TestKeyDispatch::testResolve_data()
{
    QTest::addColumn<int>("modifiers");
    QTest::addColumn<QString>("keysym");
    QTest::addColumn<KeyAction>("expected");

    QTest::newRow("shift up") << ModifierState::Shift << "Up" << KeyAction::NudgeUp;
    QTest::newRow("shift down") << ModifierState::Shift << "Down" << KeyAction::NudgeDown;
    QTest::newRow("shift left") << ModifierState::Shift << "Left" << KeyAction::NudgeLeft;
    QTest::newRow("shift right") << ModifierState::Shift << "Right" << KeyAction::NudgeRight;
    QTest::newRow("control up") << ModifierState::Control << "Up" << KeyAction::Grow;
    QTest::newRow("control down") << ModifierState::Control << "Down" << KeyAction::Shrink;
    QTest::newRow("control d") << ModifierState::Control << "d" << KeyAction::Duplicate;
    QTest::newRow("control x") << ModifierState::Control << "x" << KeyAction::Delete;
    QTest::newRow("control r") << ModifierState::Control << "r" << KeyAction::ReleaseMultiSelection;
    QTest::newRow("control l") << ModifierState::Control << "l" << KeyAction::EraseLastPolyline;
    QTest::newRow("control f") << ModifierState::Control << "f" << KeyAction::EraseLastFreehand;
    QTest::newRow("shift control f") << ModifierState::ShiftControl << "f" << KeyAction::EraseAllFreehand;
    QTest::newRow("shift control l") << ModifierState::ShiftControl << "l" << KeyAction::EraseAllPolyline;
    QTest::newRow("alt b") << ModifierState::Alt << "b" << KeyAction::RecolorBlack;
    QTest::newRow("alt r") << ModifierState::Alt << "r" << KeyAction::RevealSelected;
    QTest::newRow("alt o") << ModifierState::Alt << "o" << KeyAction::NextOval;
    QTest::newRow("alt t") << ModifierState::Alt << "t" << KeyAction::NextRectangle;
    QTest::newRow("alt a") << ModifierState::Alt << "a" << KeyAction::NextArc;

    QTest::newRow("plain up") << ModifierState::None << "Up" << KeyAction::None;
    QTest::newRow("alt up") << ModifierState::Alt << "Up" << KeyAction::None;
    QTest::newRow("control q") << ModifierState::Control << "q" << KeyAction::None;
    QTest::newRow("shift d") << ModifierState::Shift << "d" << KeyAction::None;
}

void TestKeyDispatch::testResolve()
{
    QFETCH(int, modifiers);
    QFETCH(QString, keysym);
    QFETCH(KeyAction, expected);

    QCOMPARE(KeyDispatch::resolveKeyAction(modifiers, keysym), expected);
}

void TestKeyDispatch::testResolve_CapsLockVariants()
{
    // 3, 6 and 10 behave like 1, 4 and 8
    QCOMPARE(KeyDispatch::resolveKeyAction(3, QStringLiteral("Up")), KeyAction::NudgeUp);
    QCOMPARE(KeyDispatch::resolveKeyAction(6, QStringLiteral("d")), KeyAction::Duplicate);
    QCOMPARE(KeyDispatch::resolveKeyAction(10, QStringLiteral("b")), KeyAction::RecolorBlack);
    QCOMPARE(KeyDispatch::resolveKeyAction(7, QStringLiteral("f")), KeyAction::EraseAllFreehand);
}

void TestKeyDispatch::testResolve_Uppercase()
{
    QCOMPARE(KeyDispatch::resolveKeyAction(ModifierState::Control, QStringLiteral("X")),
             KeyAction::Delete);
    QCOMPARE(KeyDispatch::resolveKeyAction(ModifierState::ShiftControl, QStringLiteral("L")),
             KeyAction::EraseAllPolyline);
    QCOMPARE(KeyDispatch::resolveKeyAction(ModifierState::Shift, QStringLiteral("UP")),
             KeyAction::None);
}

void TestKeyDispatch::testKeysymFromQt()
{
    QCOMPARE(KeyDispatch::keysymFromQt(Qt::Key_Left), QStringLiteral("Left"));
    QCOMPARE(KeyDispatch::keysymFromQt(Qt::Key_D), QStringLiteral("d"));
    QCOMPARE(KeyDispatch::keysymFromQt(Qt::Key_Z), QStringLiteral("z"));
    QVERIFY(KeyDispatch::keysymFromQt(Qt::Key_Escape).isEmpty());
}

// ============================================================================
// Routing
// ============================================================================

void TestKeyDispatch::testApply_NoneOrNoRegistry()
{
    CanvasRegistry registry;
    QVERIFY(!KeyDispatch::applyKeyAction(KeyAction::None, &registry));
    QVERIFY(!KeyDispatch::applyKeyAction(KeyAction::Delete, nullptr));
}

void TestKeyDispatch::testApply_NudgeRoutesToActiveShapeCanvas()
{
    CanvasRegistry registry;
    ItemLayer layerA, layerB;
    ShapeController first(&layerA, &registry);
    ShapeController second(&layerB, &registry);

    first.handleMousePress(QPoint(100, 100), Qt::LeftButton);
    second.handleMousePress(QPoint(100, 100), Qt::LeftButton);
    ItemId id = *second.selected();

    QVERIFY(KeyDispatch::applyKeyAction(KeyAction::NudgeRight, &registry));

    QCOMPARE(second.registry().find(id)->center, QPointF(101, 100));
    QCOMPARE(first.registry().shapes().first().center, QPointF(100, 100));
}

void TestKeyDispatch::testApply_ShapeCommandWithoutShapeCanvas()
{
    CanvasRegistry registry;
    QVERIFY(!KeyDispatch::applyKeyAction(KeyAction::Duplicate, &registry));
}

void TestKeyDispatch::testApply_EraseAllScopedToMode()
{
    CanvasRegistry registry;
    ItemLayer freehandLayer, polylineLayer;
    DrawController freehand(DrawMode::Freehand, &freehandLayer, &registry);
    DrawController polyline(DrawMode::Polyline, &polylineLayer, &registry);

    polyline.handleMousePress(QPoint(0, 0), Qt::LeftButton);
    polyline.handleMousePress(QPoint(10, 0), Qt::LeftButton);
    freehandLayer.createLine(QPointF(0, 0), QPointF(5, 5), Qt::black, 1);

    KeyAction action = KeyDispatch::resolveKeyAction(ModifierState::ShiftControl, QStringLiteral("l"));
    QVERIFY(KeyDispatch::applyKeyAction(action, &registry));

    QVERIFY(polylineLayer.isEmpty());
    QVERIFY(!polyline.isDrawing());
    QCOMPARE(freehandLayer.itemCount(), size_t(1));
}

void TestKeyDispatch::testApply_NextShapeKind()
{
    CanvasRegistry registry;
    ItemLayer layer;
    ShapeController controller(&layer, &registry);

    QVERIFY(KeyDispatch::applyKeyAction(KeyAction::NextArc, &registry));
    QCOMPARE(controller.nextShapeKind(), ShapeKind::Arc);

    controller.handleMousePress(QPoint(100, 100), Qt::LeftButton);
    QCOMPARE(controller.registry().last()->kind, ShapeKind::Arc);
}

QTEST_MAIN(TestKeyDispatch)
#include "tst_KeyDispatch.moc"
