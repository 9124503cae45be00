#include "tools/handlers/PolylineToolHandler.h"
#include "tools/DrawContext.h"
#include "input/ModifierState.h"

#include <QDebug>
#include <QPainter>

void PolylineToolHandler::onPrimaryPress(DrawContext* ctx, const QPoint& pos, int modifiers)
{
    if (!ctx->pointer.isActive()) {
        // First click only anchors the run
        ctx->pointer.recordClick(pos);
        m_lastPressSegment.reset();
        m_isDrawing = true;
        m_anchor = pos;
        m_currentMousePos = pos;
        m_previewColor = ctx->color;
        ctx->repaint();
        return;
    }

    m_lastPressSegment = ctx->drawSegment(ctx->pointer.start(), pos);
    ctx->pointer.recordClick(pos);
    m_anchor = pos;

    // Control ends the run without closing it
    if (modifiers == ModifierState::Control) {
        qDebug() << "PolylineToolHandler: Run ended open with" << ctx->run.segmentTags.size() << "segments";
        finishRun(ctx);
        return;
    }

    ctx->repaint();
}

void PolylineToolHandler::onDoubleClick(DrawContext* ctx, const QPoint& pos)
{
    Q_UNUSED(pos);
    if (!ctx->pointer.isActive()) {
        return;
    }

    // The second press of a double-click arrives as a normal press first;
    // drop what it drew so the run closes from the point clicked before it
    if (m_lastPressSegment && !ctx->run.segmentTags.isEmpty()
        && ctx->run.segmentTags.last() == *m_lastPressSegment) {
        ctx->surface->deleteItem(*m_lastPressSegment);
        ctx->run.segmentTags.removeLast();
        ctx->pointer.popLastPoint();
    }
    m_lastPressSegment.reset();

    const auto first = ctx->pointer.first();
    if (!first || ctx->run.segmentTags.isEmpty()) {
        // Nothing drawn yet, so there is nothing to close
        qDebug() << "PolylineToolHandler: Double-click without segments, run abandoned";
        ctx->pointer.reset();
        m_isDrawing = false;
        ctx->repaint();
        return;
    }

    ctx->drawSegment(ctx->pointer.start(), *first);
    finishRun(ctx);
}

void PolylineToolHandler::onSecondaryPress(DrawContext* ctx, const QPoint& pos)
{
    Q_UNUSED(pos);
    if (!ctx->pointer.isActive()) {
        return;
    }

    if (!ctx->run.segmentTags.isEmpty()) {
        ctx->surface->deleteItem(ctx->run.segmentTags.last());
        ctx->run.segmentTags.removeLast();
    }
    m_lastPressSegment.reset();

    ctx->pointer.popLastPoint();
    if (ctx->pointer.isActive()) {
        m_anchor = ctx->pointer.start();
    } else {
        m_isDrawing = false;
    }
    ctx->repaint();
}

void PolylineToolHandler::onHover(DrawContext* ctx, const QPoint& pos)
{
    m_currentMousePos = pos;
    if (m_isDrawing) {
        ctx->repaint();
    }
}

void PolylineToolHandler::finishRun(DrawContext* ctx)
{
    ctx->completeRun();
    ctx->pointer.reset();
    m_lastPressSegment.reset();
    m_isDrawing = false;
    ctx->repaint();
}

void PolylineToolHandler::drawPreview(QPainter& painter) const
{
    if (!m_isDrawing) {
        return;
    }

    painter.save();
    QPen pen(m_previewColor, 1, Qt::DashLine);
    painter.setPen(pen);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.drawLine(m_anchor, m_currentMousePos);
    painter.restore();
}

void PolylineToolHandler::cancelDrawing()
{
    m_isDrawing = false;
    m_lastPressSegment.reset();
}
