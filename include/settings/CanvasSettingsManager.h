#ifndef CANVASSETTINGSMANAGER_H
#define CANVASSETTINGSMANAGER_H

#include <QColor>
#include <QSize>

#include "shapes/ShapeKind.h"

/**
 * @brief Singleton class for managing canvas defaults.
 *
 * Provides centralized access to the values every canvas is constructed
 * with (size, colors, line width) and to the shape-editing tunables
 * (hit-test halo, highlight flash), so DrawCanvas and ShapeCanvas read
 * them from one place.
 */
class CanvasSettingsManager
{
public:
    static CanvasSettingsManager& instance();

    // Canvas size
    QSize loadCanvasSize() const;
    void saveCanvasSize(const QSize& size);

    // Background color
    QColor loadBackgroundColor() const;
    void saveBackgroundColor(const QColor& color);

    // Line color and width for new segments and shapes
    QColor loadLineColor() const;
    void saveLineColor(const QColor& color);

    int loadLineWidth() const;
    void saveLineWidth(int width);

    // Hit-test tolerance in pixels
    int loadHalo() const;
    void saveHalo(int halo);

    // Selection flash
    QColor loadHighlightColor() const;
    void saveHighlightColor(const QColor& color);

    int loadFlashDuration() const;
    void saveFlashDuration(int milliseconds);

    // Kind of shape created by the next primary click
    ShapeKind loadNextShapeKind() const;
    void saveNextShapeKind(ShapeKind kind);

    // Default values
    static QSize defaultCanvasSize() { return QSize(400, 500); }
    static QColor defaultBackgroundColor() { return QColor(0xff, 0xff, 0xaa); }
    static QColor defaultLineColor() { return Qt::black; }
    static QColor defaultHighlightColor() { return QColor(0xff, 0xff, 0xaa); }
    static constexpr int kDefaultLineWidth = 1;
    static constexpr int kDefaultHalo = 25;
    static constexpr int kDefaultFlashDuration = 500;
    static constexpr ShapeKind kDefaultNextShapeKind = ShapeKind::Oval;

private:
    CanvasSettingsManager() = default;
    CanvasSettingsManager(const CanvasSettingsManager&) = delete;
    CanvasSettingsManager& operator=(const CanvasSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyCanvasWidth = "canvas/width";
    static constexpr const char* kSettingsKeyCanvasHeight = "canvas/height";
    static constexpr const char* kSettingsKeyBackgroundColor = "canvas/backgroundColor";
    static constexpr const char* kSettingsKeyLineColor = "canvas/lineColor";
    static constexpr const char* kSettingsKeyLineWidth = "canvas/lineWidth";
    static constexpr const char* kSettingsKeyHalo = "shapes/halo";
    static constexpr const char* kSettingsKeyHighlightColor = "shapes/highlightColor";
    static constexpr const char* kSettingsKeyFlashDuration = "shapes/flashDuration";
    static constexpr const char* kSettingsKeyNextShapeKind = "shapes/nextShapeKind";
};

#endif // CANVASSETTINGSMANAGER_H
