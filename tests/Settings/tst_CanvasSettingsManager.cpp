#include <QtTest>
#include <QSettings>
#include <QColor>
#include "settings/CanvasSettingsManager.h"
#include "settings/Settings.h"
#include "canvas/CanvasConfig.h"

/**
 * @brief Unit tests for CanvasSettingsManager singleton class.
 *
 * Tests settings persistence including:
 * - Singleton pattern
 * - Canvas size, colors and line width
 * - Shape tunables (halo, flash, next shape kind)
 * - Fallback to defaults for invalid values
 * - CanvasConfig construction from settings
 */
class tst_CanvasSettingsManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Singleton tests
    void testSingletonInstance();

    // Canvas tests
    void testLoadCanvasSize_DefaultValue();
    void testSaveLoadCanvasSize_Roundtrip();
    void testLoadCanvasSize_InvalidValue();
    void testLoadBackgroundColor_DefaultValue();
    void testSaveLoadBackgroundColor_Roundtrip();

    // Line tests
    void testLoadLineColor_DefaultValue();
    void testSaveLoadLineColor_Roundtrip();
    void testLoadLineWidth_DefaultValue();
    void testLoadLineWidth_InvalidValue();

    // Shape tunables
    void testLoadHalo_DefaultValue();
    void testSaveLoadHalo_Roundtrip();
    void testLoadHighlightColor_DefaultValue();
    void testLoadFlashDuration_DefaultValue();
    void testLoadFlashDuration_InvalidValue();
    void testLoadNextShapeKind_DefaultValue();
    void testSaveLoadNextShapeKind_AllValues();
    void testLoadNextShapeKind_InvalidValue();

    // CanvasConfig
    void testCanvasConfig_FromSettings();

private:
    void clearAllTestSettings();
    void writeRawValue(const char* key, const QVariant& value);
};

void tst_CanvasSettingsManager::init()
{
    clearAllTestSettings();
}

void tst_CanvasSettingsManager::cleanup()
{
    clearAllTestSettings();
}

void tst_CanvasSettingsManager::clearAllTestSettings()
{
    auto settings = SketchPad::getSettings();
    settings.remove("canvas");
    settings.remove("shapes");
    settings.sync();
}

void tst_CanvasSettingsManager::writeRawValue(const char* key, const QVariant& value)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(key, value);
    settings.sync();
}

// ============================================================================
// Singleton tests
// ============================================================================

void tst_CanvasSettingsManager::testSingletonInstance()
{
    CanvasSettingsManager& instance1 = CanvasSettingsManager::instance();
    CanvasSettingsManager& instance2 = CanvasSettingsManager::instance();

    QCOMPARE(&instance1, &instance2);
}

// ============================================================================
// Canvas tests
// ============================================================================

void tst_CanvasSettingsManager::testLoadCanvasSize_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadCanvasSize(), QSize(400, 500));
}

void tst_CanvasSettingsManager::testSaveLoadCanvasSize_Roundtrip()
{
    CanvasSettingsManager& manager = CanvasSettingsManager::instance();

    manager.saveCanvasSize(QSize(640, 480));
    QCOMPARE(manager.loadCanvasSize(), QSize(640, 480));
}

void tst_CanvasSettingsManager::testLoadCanvasSize_InvalidValue()
{
    writeRawValue("canvas/width", -10);
    writeRawValue("canvas/height", 300);

    QCOMPARE(CanvasSettingsManager::instance().loadCanvasSize(),
             CanvasSettingsManager::defaultCanvasSize());
}

void tst_CanvasSettingsManager::testLoadBackgroundColor_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadBackgroundColor(), QColor("#ffffaa"));
}

void tst_CanvasSettingsManager::testSaveLoadBackgroundColor_Roundtrip()
{
    CanvasSettingsManager& manager = CanvasSettingsManager::instance();

    QColor testColor(200, 220, 255);
    manager.saveBackgroundColor(testColor);
    QCOMPARE(manager.loadBackgroundColor(), testColor);
}

// ============================================================================
// Line tests
// ============================================================================

void tst_CanvasSettingsManager::testLoadLineColor_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadLineColor(), QColor(Qt::black));
}

void tst_CanvasSettingsManager::testSaveLoadLineColor_Roundtrip()
{
    CanvasSettingsManager& manager = CanvasSettingsManager::instance();

    // Test color with alpha channel
    QColor semiTransparent(0, 0, 255, 128);
    manager.saveLineColor(semiTransparent);

    QColor loaded = manager.loadLineColor();
    QCOMPARE(loaded.blue(), 255);
    QCOMPARE(loaded.alpha(), 128);
}

void tst_CanvasSettingsManager::testLoadLineWidth_DefaultValue()
{
    int width = CanvasSettingsManager::instance().loadLineWidth();
    QCOMPARE(width, CanvasSettingsManager::kDefaultLineWidth);
    QCOMPARE(width, 1);
}

void tst_CanvasSettingsManager::testLoadLineWidth_InvalidValue()
{
    writeRawValue("canvas/lineWidth", 0);
    QCOMPARE(CanvasSettingsManager::instance().loadLineWidth(), 1);
}

// ============================================================================
// Shape tunables
// ============================================================================

void tst_CanvasSettingsManager::testLoadHalo_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadHalo(), 25);
}

void tst_CanvasSettingsManager::testSaveLoadHalo_Roundtrip()
{
    CanvasSettingsManager& manager = CanvasSettingsManager::instance();

    manager.saveHalo(0);
    QCOMPARE(manager.loadHalo(), 0);

    manager.saveHalo(40);
    QCOMPARE(manager.loadHalo(), 40);
}

void tst_CanvasSettingsManager::testLoadHighlightColor_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadHighlightColor(), QColor(0xff, 0xff, 0xaa));
}

void tst_CanvasSettingsManager::testLoadFlashDuration_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadFlashDuration(), 500);
}

void tst_CanvasSettingsManager::testLoadFlashDuration_InvalidValue()
{
    writeRawValue("shapes/flashDuration", -1);
    QCOMPARE(CanvasSettingsManager::instance().loadFlashDuration(),
             CanvasSettingsManager::kDefaultFlashDuration);
}

void tst_CanvasSettingsManager::testLoadNextShapeKind_DefaultValue()
{
    QCOMPARE(CanvasSettingsManager::instance().loadNextShapeKind(), ShapeKind::Oval);
}

void tst_CanvasSettingsManager::testSaveLoadNextShapeKind_AllValues()
{
    CanvasSettingsManager& manager = CanvasSettingsManager::instance();

    const QList<ShapeKind> kinds = {ShapeKind::Oval, ShapeKind::Rectangle, ShapeKind::Arc};
    for (ShapeKind kind : kinds) {
        manager.saveNextShapeKind(kind);
        QCOMPARE(manager.loadNextShapeKind(), kind);
    }
}

void tst_CanvasSettingsManager::testLoadNextShapeKind_InvalidValue()
{
    writeRawValue("shapes/nextShapeKind", 99);
    QCOMPARE(CanvasSettingsManager::instance().loadNextShapeKind(), ShapeKind::Oval);
}

// ============================================================================
// CanvasConfig
// ============================================================================

void tst_CanvasSettingsManager::testCanvasConfig_FromSettings()
{
    CanvasSettingsManager& manager = CanvasSettingsManager::instance();
    manager.saveCanvasSize(QSize(300, 200));
    manager.saveLineWidth(3);
    manager.saveLineColor(Qt::darkRed);

    CanvasConfig config = CanvasConfig::fromSettings(DrawMode::Polyline);

    QCOMPARE(config.size, QSize(300, 200));
    QCOMPARE(config.drawMode, DrawMode::Polyline);
    QCOMPARE(config.lineWidth, 3);
    QCOMPARE(config.lineColor, QColor(Qt::darkRed));
    QCOMPARE(config.backgroundColor, CanvasSettingsManager::defaultBackgroundColor());
}

QTEST_MAIN(tst_CanvasSettingsManager)
#include "tst_CanvasSettingsManager.moc"
