#ifndef DRAWCONTEXT_H
#define DRAWCONTEXT_H

#include <QColor>
#include <QPoint>
#include <QSize>
#include <QVector>
#include <functional>

#include "canvas/IDrawingSurface.h"
#include "canvas/PointerState.h"
#include "items/CanvasItem.h"

/**
 * @brief Segments of the open run and of the last completed one.
 *
 * segmentTags is empty exactly when no run is open.
 */
struct LineRun {
    QVector<ItemId> segmentTags;
    QVector<ItemId> lastCompletedRun;

    bool isOpen() const { return !segmentTags.isEmpty(); }
};

/**
 * @brief Shared state passed to draw-mode handlers.
 */
class DrawContext {
public:
    IDrawingSurface* surface = nullptr;

    // Current drawing settings
    QColor color = Qt::black;
    int width = 1;
    QSize canvasSize;

    PointerState pointer;
    LineRun run;

    std::function<void()> requestRepaint;

    /**
     * @brief Draw a segment on the surface and add it to the open run.
     */
    ItemId drawSegment(const QPoint& from, const QPoint& to) {
        ItemId id = surface->createLine(from, to, color, width);
        run.segmentTags.append(id);
        return id;
    }

    /**
     * @brief Move the open run into lastCompletedRun.
     *
     * An empty open run leaves the previous completed run in place.
     */
    void completeRun() {
        if (run.segmentTags.isEmpty()) {
            return;
        }
        run.lastCompletedRun = run.segmentTags;
        run.segmentTags.clear();
    }

    void repaint() {
        if (requestRepaint) {
            requestRepaint();
        }
    }
};

#endif // DRAWCONTEXT_H
