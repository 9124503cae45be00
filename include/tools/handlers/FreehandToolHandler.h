#ifndef FREEHANDTOOLHANDLER_H
#define FREEHANDTOOLHANDLER_H

#include "../IDrawModeHandler.h"

/**
 * @brief Freehand drawing: every drag sample adds a segment.
 */
class FreehandToolHandler : public IDrawModeHandler {
public:
    FreehandToolHandler() = default;
    ~FreehandToolHandler() override = default;

    DrawMode mode() const override { return DrawMode::Freehand; }

    void onPrimaryPress(DrawContext* ctx, const QPoint& pos, int modifiers) override;
    void onPrimaryDrag(DrawContext* ctx, const QPoint& pos) override;
    void onPrimaryRelease(DrawContext* ctx, const QPoint& pos) override;

    bool isDrawing() const override { return m_isDrawing; }
    void cancelDrawing() override { m_isDrawing = false; }

private:
    bool m_isDrawing = false;
};

#endif // FREEHANDTOOLHANDLER_H
