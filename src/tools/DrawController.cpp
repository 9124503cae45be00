#include "tools/DrawController.h"
#include "tools/handlers/FreehandToolHandler.h"
#include "tools/handlers/PolylineToolHandler.h"
#include "canvas/CanvasRegistry.h"
#include "canvas/IDrawingSurface.h"
#include "canvas/Readouts.h"
#include "input/ModifierState.h"

#include <QDebug>
#include <QPainter>

namespace {

std::unique_ptr<IDrawModeHandler> createHandler(DrawMode mode)
{
    switch (mode) {
    case DrawMode::Freehand:
        return std::make_unique<FreehandToolHandler>();
    case DrawMode::Polyline:
        return std::make_unique<PolylineToolHandler>();
    }
    return std::make_unique<FreehandToolHandler>();
}

} // namespace

DrawController::DrawController(DrawMode mode, IDrawingSurface* surface,
                               CanvasRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_handler(createHandler(mode))
    , m_context(std::make_unique<DrawContext>())
    , m_registry(registry)
{
    m_context->surface = surface;
    m_context->requestRepaint = [this]() {
        emit needsRepaint();
    };

    installBindings();

    if (m_registry) {
        m_registry->registerDrawController(this);
    }
}

DrawController::~DrawController()
{
    if (m_registry) {
        m_registry->unregisterDrawController(this);
    }
}

void DrawController::installBindings()
{
    IDrawModeHandler* h = m_handler.get();
    DrawContext* ctx = m_context.get();

    switch (h->mode()) {
    case DrawMode::Freehand:
        m_bindings = {
            {Gesture::Press, Qt::LeftButton,
             [h, ctx](const QPoint& pos, int mods) { h->onPrimaryPress(ctx, pos, mods); }},
            {Gesture::Drag, Qt::LeftButton,
             [h, ctx](const QPoint& pos, int) { h->onPrimaryDrag(ctx, pos); }},
            {Gesture::Release, Qt::LeftButton,
             [h, ctx](const QPoint& pos, int) { h->onPrimaryRelease(ctx, pos); }},
        };
        break;
    case DrawMode::Polyline:
        m_bindings = {
            {Gesture::Press, Qt::LeftButton,
             [h, ctx](const QPoint& pos, int mods) { h->onPrimaryPress(ctx, pos, mods); }},
            {Gesture::DoubleClick, Qt::LeftButton,
             [h, ctx](const QPoint& pos, int) { h->onDoubleClick(ctx, pos); }},
            {Gesture::Press, Qt::RightButton,
             [h, ctx](const QPoint& pos, int) { h->onSecondaryPress(ctx, pos); }},
        };
        break;
    }
}

bool DrawController::dispatch(Gesture gesture, Qt::MouseButton button,
                              const QPoint& pos, int modifiers)
{
    for (const auto& binding : m_bindings) {
        if (binding.gesture == gesture && binding.button == button) {
            binding.action(pos, ModifierState::normalize(modifiers));
            return true;
        }
    }
    return false;
}

void DrawController::handleMousePress(const QPoint& pos, Qt::MouseButton button, int modifiers)
{
    bool wasDrawing = m_handler->isDrawing();
    dispatch(Gesture::Press, button, pos, modifiers);
    if (!wasDrawing && m_handler->isDrawing()) {
        emit drawingStarted();
    } else if (wasDrawing && !m_handler->isDrawing()) {
        emit drawingFinished();
    }
}

void DrawController::handleMouseMove(const QPoint& pos, Qt::MouseButtons buttons, int modifiers)
{
    Readouts::showCursorPosition(m_context->surface, m_context->canvasSize, pos);

    if (buttons & Qt::LeftButton) {
        dispatch(Gesture::Drag, Qt::LeftButton, pos, modifiers);
    } else {
        m_handler->onHover(m_context.get(), pos);
    }
}

void DrawController::handleMouseRelease(const QPoint& pos, Qt::MouseButton button, int modifiers)
{
    bool wasDrawing = m_handler->isDrawing();
    dispatch(Gesture::Release, button, pos, modifiers);
    if (wasDrawing && !m_handler->isDrawing()) {
        emit drawingFinished();
    }
}

void DrawController::handleDoubleClick(const QPoint& pos, Qt::MouseButton button, int modifiers)
{
    bool wasDrawing = m_handler->isDrawing();
    dispatch(Gesture::DoubleClick, button, pos, modifiers);
    if (wasDrawing && !m_handler->isDrawing()) {
        emit drawingFinished();
    }
}

void DrawController::handleLeave()
{
    Readouts::clearCursorPosition(m_context->surface);
}

void DrawController::drawCurrentPreview(QPainter& painter) const
{
    m_handler->drawPreview(painter);
}

bool DrawController::isDrawing() const
{
    return m_handler->isDrawing();
}

void DrawController::eraseLastRun()
{
    LineRun& run = m_context->run;
    if (run.lastCompletedRun.isEmpty()) {
        qDebug() << "DrawController: No completed" << drawModeName(mode()) << "run to erase";
        return;
    }

    for (ItemId id : run.lastCompletedRun) {
        m_context->surface->deleteItem(id);
    }
    qDebug() << "DrawController: Erased" << run.lastCompletedRun.size()
             << drawModeName(mode()) << "segments";
    run.lastCompletedRun.clear();

    m_context->repaint();
}

void DrawController::eraseAll()
{
    bool wasDrawing = m_handler->isDrawing();

    const QVector<ItemId> items = m_context->surface->allItems();
    for (ItemId id : items) {
        m_context->surface->deleteItem(id);
    }

    m_context->run.segmentTags.clear();
    m_context->run.lastCompletedRun.clear();
    m_context->pointer.reset();
    m_handler->cancelDrawing();

    qDebug() << "DrawController: Erased all" << items.size() << "items on"
             << drawModeName(mode()) << "canvas";

    if (wasDrawing) {
        emit drawingFinished();
    }
    m_context->repaint();
}

void DrawController::setCanvasSize(const QSize& size)
{
    m_context->canvasSize = size;
}

void DrawController::setColor(const QColor& color)
{
    m_context->color = color;
}

void DrawController::setWidth(int width)
{
    m_context->width = width;
}
