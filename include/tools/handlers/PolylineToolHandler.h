#ifndef POLYLINETOOLHANDLER_H
#define POLYLINETOOLHANDLER_H

#include "../IDrawModeHandler.h"
#include "items/CanvasItem.h"

#include <QColor>
#include <QPoint>
#include <optional>

/**
 * @brief Tool handler for connect-the-dots drawing.
 *
 * Click to add points, double-click to close the shape back to the first
 * point, Control-click to end it open. Secondary click undoes the last
 * segment.
 */
class PolylineToolHandler : public IDrawModeHandler
{
public:
    PolylineToolHandler() = default;
    ~PolylineToolHandler() override = default;

    DrawMode mode() const override { return DrawMode::Polyline; }

    void onPrimaryPress(DrawContext* ctx, const QPoint& pos, int modifiers) override;
    void onDoubleClick(DrawContext* ctx, const QPoint& pos) override;
    void onSecondaryPress(DrawContext* ctx, const QPoint& pos) override;
    void onHover(DrawContext* ctx, const QPoint& pos) override;

    void drawPreview(QPainter& painter) const override;
    bool isDrawing() const override { return m_isDrawing; }
    void cancelDrawing() override;

private:
    void finishRun(DrawContext* ctx);

    bool m_isDrawing = false;
    // Segment drawn by the most recent press, if any
    std::optional<ItemId> m_lastPressSegment;
    QPoint m_anchor;
    QPoint m_currentMousePos;
    QColor m_previewColor;
};

#endif // POLYLINETOOLHANDLER_H
