#ifndef SHAPECONTROLLER_H
#define SHAPECONTROLLER_H

#include <QColor>
#include <QObject>
#include <QPoint>
#include <QPointF>
#include <QPointer>
#include <QSize>
#include <QVector>
#include <functional>
#include <optional>
#include <vector>

#include "canvas/PointerState.h"
#include "items/CanvasItem.h"
#include "shapes/ShapeKind.h"
#include "shapes/ShapeRegistry.h"

class CanvasRegistry;
class IDrawingSurface;

/**
 * @brief Shape-mode controller for one shape canvas.
 *
 * Owns the shape registry and the selection state. Pointer events are
 * routed through press and motion binding tables keyed on button and
 * modifier state; keyboard commands arrive through the public operations.
 *
 * Selection model:
 * - selected() is the single active shape (last created, selected or
 *   toggled); empty only when no shapes exist.
 * - multiSelected() is an ordered set whose last entry is the primary
 *   shape. When non-empty, drag, resize, nudge and delete apply to every
 *   member; otherwise to selected() alone.
 */
class ShapeController : public QObject
{
    Q_OBJECT

public:
    explicit ShapeController(IDrawingSurface *surface, CanvasRegistry *registry = nullptr,
                             QObject *parent = nullptr);
    ~ShapeController() override;

    // Event dispatch; modifiers is a ModifierState bitmask
    void handleMousePress(const QPoint &pos, Qt::MouseButton button, int modifiers = 0);
    void handleMouseMove(const QPoint &pos, int modifiers = 0);
    void handleLeave();

    /**
     * @brief Create a shape of nextShapeKind() centred on pos.
     *
     * The new shape becomes selected() and the multi-selection is released.
     */
    std::optional<ItemId> createShape(const QPoint &pos);

    /**
     * @brief Select the shape nearest pos within the halo and flash it.
     * @return false if no shape is close enough
     */
    bool selectNearest(const QPoint &pos);

    /**
     * @brief Make the most recently created shape selected() and flash it.
     */
    bool selectLastCreated();

    /**
     * @brief Toggle the shape nearest pos in or out of the multi-selection.
     *
     * selected() is left untouched. Members carry a grey outline; leaving
     * the set restores the registry color.
     */
    bool toggleMultiSelect(const QPoint &pos);

    /**
     * @brief Move the selection one pixel per axis toward pos.
     * @param constrained lock motion to the dominant axis
     */
    void dragSelection(const QPoint &pos, bool constrained = false);

    /**
     * @brief Scale the selection up when pos moved up, down when it moved
     * down, each shape about its own center.
     */
    void resizeSelection(const QPoint &pos);

    void nudgeSelection(int dx, int dy);

    /**
     * @brief Move every edge of each selected box out (delta > 0) or in
     * (delta < 0) by one pixel.
     */
    void nudgeSize(int delta);

    std::optional<ItemId> duplicateSelected();
    void deleteSelection();
    void releaseMultiSelection();

    /**
     * @brief Recolor the shape nearest the last pointer position.
     */
    bool recolorNearest(const QColor &color);

    void revealSelected();

    // Settings
    void setNextShapeKind(ShapeKind kind) { m_nextShapeKind = kind; }
    ShapeKind nextShapeKind() const { return m_nextShapeKind; }

    void setLineColor(const QColor &color) { m_lineColor = color; }
    QColor lineColor() const { return m_lineColor; }

    void setLineWidth(int width) { m_lineWidth = width; }
    int lineWidth() const { return m_lineWidth; }

    void setHalo(int halo) { m_halo = halo; }
    int halo() const { return m_halo; }

    void setHighlightColor(const QColor &color) { m_highlightColor = color; }
    QColor highlightColor() const { return m_highlightColor; }

    void setFlashDuration(int milliseconds) { m_flashDuration = milliseconds; }
    int flashDuration() const { return m_flashDuration; }

    void setCanvasSize(const QSize &size) { m_canvasSize = size; }

    // Introspection
    std::optional<ItemId> selected() const { return m_selected; }
    const QVector<ItemId>& multiSelected() const { return m_multiSelected; }
    const ShapeRegistry& registry() const { return m_registry; }
    const PointerState& pointer() const { return m_pointer; }
    QPoint lastPointerPos() const { return m_lastPointerPos; }
    IDrawingSurface* surface() const { return m_surface; }

    static constexpr int kDuplicateOffset = 10;
    static constexpr qreal kGrowFactor = 1.01;
    static constexpr qreal kShrinkFactor = 0.99;
    static QColor multiSelectOutline() { return QColor(190, 190, 190); }

signals:
    void selectionChanged();
    void multiSelectionChanged();
    void centerReported(const QPointF &center);

private:
    static constexpr int kAnyModifiers = -1;

    struct PressBinding {
        Qt::MouseButton button;
        int modifiers;
        std::function<void(const QPoint&)> action;
    };

    struct MotionBinding {
        int modifiers;
        std::function<void(const QPoint&)> action;
    };

    void installBindings();

    QVector<ItemId> targets() const;
    std::optional<ItemId> primaryShape() const;
    std::optional<ItemId> nearestShape(const QPoint &pos) const;
    void setSelected(std::optional<ItemId> id);
    void clearMultiSelection();
    void clearHighlights();
    void flash(ItemId id);
    void syncCenter(Shape &shape);
    void reportCenter(ItemId id);

    IDrawingSurface *m_surface;
    QPointer<CanvasRegistry> m_canvasRegistry;

    ShapeRegistry m_registry;
    PointerState m_pointer;
    std::optional<ItemId> m_selected;
    QVector<ItemId> m_multiSelected;

    // Last pointer position seen by any event, for proximity commands
    QPoint m_lastPointerPos;
    // Reference y for resize gestures
    QPoint m_motionAnchor;

    ShapeKind m_nextShapeKind = ShapeKind::Oval;
    QColor m_lineColor = Qt::black;
    int m_lineWidth = 1;
    int m_halo = 25;
    QColor m_highlightColor = QColor(0xff, 0xff, 0xaa);
    int m_flashDuration = 500;
    QSize m_canvasSize;

    std::vector<PressBinding> m_pressBindings;
    std::vector<MotionBinding> m_motionBindings;
};

#endif // SHAPECONTROLLER_H
