#include "tools/handlers/FreehandToolHandler.h"
#include "tools/DrawContext.h"

void FreehandToolHandler::onPrimaryPress(DrawContext* ctx, const QPoint& pos, int modifiers) {
    Q_UNUSED(modifiers);
    m_isDrawing = true;
    ctx->pointer.recordClick(pos);
    ctx->repaint();
}

void FreehandToolHandler::onPrimaryDrag(DrawContext* ctx, const QPoint& pos) {
    if (!ctx->pointer.isActive()) {
        // Drag entered the canvas with the button already down
        m_isDrawing = true;
        ctx->pointer.recordClick(pos);
        return;
    }

    ctx->drawSegment(ctx->pointer.start(), pos);
    ctx->pointer.recordClick(pos);
    ctx->repaint();
}

void FreehandToolHandler::onPrimaryRelease(DrawContext* ctx, const QPoint& pos) {
    Q_UNUSED(pos);
    if (!m_isDrawing) {
        return;
    }

    ctx->completeRun();
    ctx->pointer.reset();
    m_isDrawing = false;

    ctx->repaint();
}
