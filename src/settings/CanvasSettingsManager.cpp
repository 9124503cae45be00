#include "settings/CanvasSettingsManager.h"
#include "settings/Settings.h"
#include <QDebug>
#include <QSettings>

CanvasSettingsManager& CanvasSettingsManager::instance()
{
    static CanvasSettingsManager instance;
    return instance;
}

QSize CanvasSettingsManager::loadCanvasSize() const
{
    auto settings = SketchPad::getSettings();
    const QSize fallback = defaultCanvasSize();
    int width = settings.value(kSettingsKeyCanvasWidth, fallback.width()).toInt();
    int height = settings.value(kSettingsKeyCanvasHeight, fallback.height()).toInt();
    if (width <= 0 || height <= 0) {
        qWarning() << "CanvasSettingsManager: Ignoring invalid canvas size" << width << height;
        return fallback;
    }
    return QSize(width, height);
}

void CanvasSettingsManager::saveCanvasSize(const QSize& size)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyCanvasWidth, size.width());
    settings.setValue(kSettingsKeyCanvasHeight, size.height());
}

QColor CanvasSettingsManager::loadBackgroundColor() const
{
    auto settings = SketchPad::getSettings();
    QColor color = settings.value(kSettingsKeyBackgroundColor, defaultBackgroundColor()).value<QColor>();
    return color.isValid() ? color : defaultBackgroundColor();
}

void CanvasSettingsManager::saveBackgroundColor(const QColor& color)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyBackgroundColor, color);
}

QColor CanvasSettingsManager::loadLineColor() const
{
    auto settings = SketchPad::getSettings();
    QColor color = settings.value(kSettingsKeyLineColor, defaultLineColor()).value<QColor>();
    return color.isValid() ? color : defaultLineColor();
}

void CanvasSettingsManager::saveLineColor(const QColor& color)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyLineColor, color);
}

int CanvasSettingsManager::loadLineWidth() const
{
    auto settings = SketchPad::getSettings();
    int width = settings.value(kSettingsKeyLineWidth, kDefaultLineWidth).toInt();
    if (width <= 0) {
        qWarning() << "CanvasSettingsManager: Ignoring invalid line width" << width;
        return kDefaultLineWidth;
    }
    return width;
}

void CanvasSettingsManager::saveLineWidth(int width)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyLineWidth, width);
}

int CanvasSettingsManager::loadHalo() const
{
    auto settings = SketchPad::getSettings();
    int halo = settings.value(kSettingsKeyHalo, kDefaultHalo).toInt();
    if (halo < 0) {
        qWarning() << "CanvasSettingsManager: Ignoring negative halo" << halo;
        return kDefaultHalo;
    }
    return halo;
}

void CanvasSettingsManager::saveHalo(int halo)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyHalo, halo);
}

QColor CanvasSettingsManager::loadHighlightColor() const
{
    auto settings = SketchPad::getSettings();
    QColor color = settings.value(kSettingsKeyHighlightColor, defaultHighlightColor()).value<QColor>();
    return color.isValid() ? color : defaultHighlightColor();
}

void CanvasSettingsManager::saveHighlightColor(const QColor& color)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyHighlightColor, color);
}

int CanvasSettingsManager::loadFlashDuration() const
{
    auto settings = SketchPad::getSettings();
    int duration = settings.value(kSettingsKeyFlashDuration, kDefaultFlashDuration).toInt();
    if (duration <= 0) {
        qWarning() << "CanvasSettingsManager: Ignoring invalid flash duration" << duration;
        return kDefaultFlashDuration;
    }
    return duration;
}

void CanvasSettingsManager::saveFlashDuration(int milliseconds)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyFlashDuration, milliseconds);
}

ShapeKind CanvasSettingsManager::loadNextShapeKind() const
{
    auto settings = SketchPad::getSettings();
    int value = settings.value(kSettingsKeyNextShapeKind,
                               static_cast<int>(kDefaultNextShapeKind)).toInt();
    if (!ShapeKinds::isValid(value)) {
        qWarning() << "CanvasSettingsManager: Ignoring unknown shape kind" << value;
        return kDefaultNextShapeKind;
    }
    return static_cast<ShapeKind>(value);
}

void CanvasSettingsManager::saveNextShapeKind(ShapeKind kind)
{
    auto settings = SketchPad::getSettings();
    settings.setValue(kSettingsKeyNextShapeKind, static_cast<int>(kind));
}
