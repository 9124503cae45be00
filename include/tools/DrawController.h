#ifndef DRAWCONTROLLER_H
#define DRAWCONTROLLER_H

#include <QObject>
#include <QPoint>
#include <QPointer>
#include <QSize>
#include <functional>
#include <memory>
#include <vector>

#include "DrawMode.h"
#include "DrawContext.h"
#include "IDrawModeHandler.h"

class QPainter;
class CanvasRegistry;
class IDrawingSurface;

/**
 * @brief Drawing-mode controller for one draw canvas.
 *
 * Owns the handler for the sub-mode chosen at construction and the
 * shared DrawContext. Pointer events are routed through a binding table
 * built from the sub-mode, so a gesture the mode does not bind is
 * ignored. Registers with the CanvasRegistry so keyboard erase commands
 * reach every sibling canvas of the same sub-mode.
 */
class DrawController : public QObject {
    Q_OBJECT

public:
    enum class Gesture {
        Press,
        Drag,
        Release,
        DoubleClick
    };

    DrawController(DrawMode mode, IDrawingSurface* surface,
                   CanvasRegistry* registry = nullptr, QObject* parent = nullptr);
    ~DrawController() override;

    DrawMode mode() const { return m_handler->mode(); }
    IDrawModeHandler* handler() { return m_handler.get(); }

    // Event dispatch methods; modifiers is a ModifierState bitmask
    void handleMousePress(const QPoint& pos, Qt::MouseButton button, int modifiers = 0);
    void handleMouseMove(const QPoint& pos, Qt::MouseButtons buttons, int modifiers = 0);
    void handleMouseRelease(const QPoint& pos, Qt::MouseButton button, int modifiers = 0);
    void handleDoubleClick(const QPoint& pos, Qt::MouseButton button, int modifiers = 0);
    void handleLeave();

    /**
     * @brief Draw the current handler preview.
     */
    void drawCurrentPreview(QPainter& painter) const;

    bool isDrawing() const;

    /**
     * @brief Delete the segments of the last completed run.
     */
    void eraseLastRun();

    /**
     * @brief Delete everything rendered on this canvas and forget all runs.
     */
    void eraseAll();

    // Context management
    DrawContext* context() { return m_context.get(); }
    const PointerState& pointer() const { return m_context->pointer; }
    const LineRun& run() const { return m_context->run; }

    void setCanvasSize(const QSize& size);

    // Drawing settings
    void setColor(const QColor& color);
    QColor color() const { return m_context->color; }

    void setWidth(int width);
    int width() const { return m_context->width; }

signals:
    /**
     * @brief Emitted when a gesture opens a run or pointer sequence.
     */
    void drawingStarted();

    /**
     * @brief Emitted when the open run is finished or abandoned.
     */
    void drawingFinished();

    /**
     * @brief Emitted when a repaint is needed.
     */
    void needsRepaint();

private:
    using Action = std::function<void(const QPoint&, int)>;

    struct Binding {
        Gesture gesture;
        Qt::MouseButton button;
        Action action;
    };

    void installBindings();
    bool dispatch(Gesture gesture, Qt::MouseButton button, const QPoint& pos, int modifiers);

    std::unique_ptr<IDrawModeHandler> m_handler;
    std::unique_ptr<DrawContext> m_context;
    std::vector<Binding> m_bindings;
    QPointer<CanvasRegistry> m_registry;
};

#endif // DRAWCONTROLLER_H
