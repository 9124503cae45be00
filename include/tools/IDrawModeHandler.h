#ifndef IDRAWMODEHANDLER_H
#define IDRAWMODEHANDLER_H

#include <QPoint>
#include <QCursor>

#include "DrawMode.h"

class QPainter;
class DrawContext;

/**
 * @brief Abstract interface for draw-canvas gesture handlers.
 *
 * Each drawing sub-mode implements this interface. The DrawController
 * owns exactly one handler, chosen at construction, and routes bound
 * pointer gestures to it.
 */
class IDrawModeHandler {
public:
    virtual ~IDrawModeHandler() = default;

    /**
     * @brief Get the sub-mode this handler implements.
     */
    virtual DrawMode mode() const = 0;

    /**
     * @brief Called when the primary button is pressed.
     * @param modifiers ModifierState bitmask, Caps Lock already masked out
     */
    virtual void onPrimaryPress(DrawContext* ctx, const QPoint& pos, int modifiers) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
        Q_UNUSED(modifiers);
    }

    /**
     * @brief Called for every motion sample while the primary button is held.
     */
    virtual void onPrimaryDrag(DrawContext* ctx, const QPoint& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when the primary button is released.
     */
    virtual void onPrimaryRelease(DrawContext* ctx, const QPoint& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called on a primary-button double click.
     *
     * onPrimaryPress has already run for the second press of the pair.
     */
    virtual void onDoubleClick(DrawContext* ctx, const QPoint& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called when the secondary button is pressed.
     */
    virtual void onSecondaryPress(DrawContext* ctx, const QPoint& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Called for motion with no button held.
     */
    virtual void onHover(DrawContext* ctx, const QPoint& pos) {
        Q_UNUSED(ctx);
        Q_UNUSED(pos);
    }

    /**
     * @brief Draw the in-progress rubber band, if any.
     */
    virtual void drawPreview(QPainter& painter) const { Q_UNUSED(painter); }

    virtual bool isDrawing() const { return false; }

    /**
     * @brief Forget any in-progress gesture without touching the surface.
     */
    virtual void cancelDrawing() {}

    virtual QCursor cursor() const { return Qt::CrossCursor; }
};

#endif // IDRAWMODEHANDLER_H
