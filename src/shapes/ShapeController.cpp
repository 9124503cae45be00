#include "shapes/ShapeController.h"
#include "shapes/DragStep.h"
#include "canvas/CanvasRegistry.h"
#include "canvas/IDrawingSurface.h"
#include "canvas/Readouts.h"
#include "input/ModifierState.h"

#include <QDebug>

ShapeController::ShapeController(IDrawingSurface *surface, CanvasRegistry *registry,
                                 QObject *parent)
    : QObject(parent)
    , m_surface(surface)
    , m_canvasRegistry(registry)
{
    installBindings();

    if (m_canvasRegistry) {
        m_canvasRegistry->registerShapeController(this);
    }
}

ShapeController::~ShapeController()
{
    if (m_canvasRegistry) {
        m_canvasRegistry->unregisterShapeController(this);
    }
}

void ShapeController::installBindings()
{
    m_pressBindings = {
        {Qt::LeftButton, kAnyModifiers,
         [this](const QPoint &pos) { createShape(pos); }},
        {Qt::RightButton, ModifierState::Shift,
         [this](const QPoint &) { selectLastCreated(); }},
        {Qt::RightButton, ModifierState::Control,
         [this](const QPoint &pos) { toggleMultiSelect(pos); }},
        {Qt::RightButton, kAnyModifiers,
         [this](const QPoint &pos) { selectNearest(pos); }},
    };

    m_motionBindings = {
        {ModifierState::Shift,
         [this](const QPoint &pos) { dragSelection(pos, false); }},
        {ModifierState::Alt,
         [this](const QPoint &pos) { dragSelection(pos, true); }},
        {ModifierState::Control,
         [this](const QPoint &pos) { resizeSelection(pos); }},
    };
}

// ============================================================================
// Event dispatch
// ============================================================================

void ShapeController::handleMousePress(const QPoint &pos, Qt::MouseButton button, int modifiers)
{
    m_lastPointerPos = pos;
    if (m_canvasRegistry) {
        m_canvasRegistry->setActiveShapeController(this);
    }

    const int state = ModifierState::normalize(modifiers);

    // Exact modifier match wins over a catch-all binding
    const PressBinding *fallback = nullptr;
    for (const auto &binding : m_pressBindings) {
        if (binding.button != button) {
            continue;
        }
        if (binding.modifiers == state) {
            binding.action(pos);
            return;
        }
        if (binding.modifiers == kAnyModifiers && !fallback) {
            fallback = &binding;
        }
    }

    if (fallback) {
        fallback->action(pos);
    }
}

void ShapeController::handleMouseMove(const QPoint &pos, int modifiers)
{
    m_lastPointerPos = pos;
    if (m_canvasRegistry) {
        m_canvasRegistry->setActiveShapeController(this);
    }
    Readouts::showCursorPosition(m_surface, m_canvasSize, pos);

    const int state = ModifierState::normalize(modifiers);
    for (const auto &binding : m_motionBindings) {
        if (binding.modifiers == state) {
            binding.action(pos);
            return;
        }
    }
}

void ShapeController::handleLeave()
{
    Readouts::clearCursorPosition(m_surface);
}

// ============================================================================
// Creation and selection
// ============================================================================

std::optional<ItemId> ShapeController::createShape(const QPoint &pos)
{
    // Shapes need only start and previous, so keep at most two points
    const bool hadClick = m_pointer.isActive();
    const QPoint lastStart = m_pointer.start();
    m_pointer.reset();
    if (hadClick) {
        m_pointer.recordClick(lastStart);
    }
    m_pointer.recordClick(pos);

    const QSize half = ShapeKinds::defaultHalfSize(m_nextShapeKind);
    const QPointF start = m_pointer.start();
    QRectF bounds(start - QPointF(half.width(), half.height()),
                  start + QPointF(half.width(), half.height()));

    ItemId id = m_surface->createShape(m_nextShapeKind, bounds, m_lineColor, m_lineWidth);

    Shape shape;
    shape.id = id;
    shape.kind = m_nextShapeKind;
    shape.center = start;
    shape.outlineColor = m_lineColor;
    m_registry.add(shape);

    clearMultiSelection();
    setSelected(id);
    m_motionAnchor = pos;

    qDebug() << "ShapeController: Created" << ShapeKinds::name(m_nextShapeKind)
             << "id" << id << "at" << pos;

    reportCenter(id);
    return id;
}

bool ShapeController::selectNearest(const QPoint &pos)
{
    clearHighlights();

    std::optional<ItemId> found = nearestShape(pos);
    if (!found) {
        qDebug() << "ShapeController: No shape found near" << pos;
        return false;
    }

    setSelected(found);
    flash(*found);
    reportCenter(*found);
    return true;
}

bool ShapeController::selectLastCreated()
{
    const Shape *last = m_registry.last();
    if (!last) {
        qDebug() << "ShapeController: No shapes to select";
        return false;
    }

    clearHighlights();
    ItemId id = last->id;
    setSelected(id);
    flash(id);
    reportCenter(id);
    return true;
}

bool ShapeController::toggleMultiSelect(const QPoint &pos)
{
    std::optional<ItemId> found = nearestShape(pos);
    if (!found) {
        qDebug() << "ShapeController: No shape found near" << pos << "to toggle";
        return false;
    }

    const ItemId id = *found;
    if (m_multiSelected.contains(id)) {
        m_multiSelected.removeAll(id);
        if (const Shape *shape = m_registry.find(id)) {
            m_surface->setOutlineColor(id, shape->outlineColor);
        }
    } else {
        m_multiSelected.append(id);
        m_surface->setOutlineColor(id, multiSelectOutline());
    }

    qDebug() << "ShapeController: Multi-selection now" << m_multiSelected;
    emit multiSelectionChanged();
    return true;
}

void ShapeController::releaseMultiSelection()
{
    clearMultiSelection();

    if (const Shape *last = m_registry.last()) {
        setSelected(last->id);
    } else {
        setSelected(std::nullopt);
    }
}

// ============================================================================
// Transforms
// ============================================================================

void ShapeController::dragSelection(const QPoint &pos, bool constrained)
{
    const QPoint previous = m_pointer.previous();
    m_pointer.trackMotion(pos);

    if (!m_selected) {
        return;
    }

    const QPoint step = constrained ? DragStep::constrainedStep(previous, pos)
                                    : DragStep::unitStep(previous, pos);

    for (ItemId id : targets()) {
        m_surface->moveItem(id, step);
        if (Shape *shape = m_registry.find(id)) {
            syncCenter(*shape);
        }
    }

    if (auto primary = primaryShape()) {
        reportCenter(*primary);
    }
}

void ShapeController::resizeSelection(const QPoint &pos)
{
    if (!m_selected) {
        return;
    }

    qreal factor = 1.0;
    if (pos.y() < m_motionAnchor.y()) {
        factor = kGrowFactor;
    } else if (pos.y() > m_motionAnchor.y()) {
        factor = kShrinkFactor;
    }
    m_motionAnchor = pos;

    if (qFuzzyCompare(factor, 1.0)) {
        return;
    }

    for (ItemId id : targets()) {
        Shape *shape = m_registry.find(id);
        if (!shape) {
            continue;
        }
        m_surface->scaleItem(id, shape->center, factor);
        syncCenter(*shape);
    }
}

void ShapeController::nudgeSelection(int dx, int dy)
{
    if (!m_selected) {
        return;
    }

    for (ItemId id : targets()) {
        m_surface->moveItem(id, QPointF(dx, dy));
        if (Shape *shape = m_registry.find(id)) {
            syncCenter(*shape);
        }
    }

    if (auto primary = primaryShape()) {
        reportCenter(*primary);
    }
}

void ShapeController::nudgeSize(int delta)
{
    if (!m_selected || delta == 0) {
        return;
    }

    const qreal d = delta > 0 ? 1.0 : -1.0;
    for (ItemId id : targets()) {
        QRectF rect = m_surface->itemRect(id);
        if (rect.isNull()) {
            continue;
        }

        QRectF adjusted = rect.adjusted(-d, -d, d, d);
        if (adjusted.width() <= 2.0 || adjusted.height() <= 2.0) {
            qDebug() << "ShapeController: Shape" << id << "is too small to shrink";
            continue;
        }
        m_surface->setItemRect(id, adjusted);
        if (Shape *shape = m_registry.find(id)) {
            syncCenter(*shape);
        }
    }
}

// ============================================================================
// Duplicate, delete, recolor
// ============================================================================

std::optional<ItemId> ShapeController::duplicateSelected()
{
    if (!m_selected) {
        qDebug() << "ShapeController: Nothing selected to duplicate";
        return std::nullopt;
    }

    const Shape *source = m_registry.find(*m_selected);
    if (!source) {
        return std::nullopt;
    }

    const QPointF offset(kDuplicateOffset, kDuplicateOffset);
    QPointF target = source->center + offset;

    // Never land exactly on top of the newest shape
    const Shape *last = m_registry.last();
    if (last && last->center == target) {
        target = source->center + offset * 2;
    }

    QRectF bounds = m_surface->itemRect(source->id);
    bounds.moveCenter(target);

    Shape copy;
    copy.kind = source->kind;
    copy.outlineColor = source->outlineColor;
    copy.center = target;
    copy.id = m_surface->createShape(copy.kind, bounds, copy.outlineColor, m_lineWidth);
    m_registry.add(copy);

    qDebug() << "ShapeController: Duplicated shape" << source->id << "as" << copy.id;

    setSelected(copy.id);
    reportCenter(copy.id);
    return copy.id;
}

void ShapeController::deleteSelection()
{
    if (!m_multiSelected.isEmpty()) {
        for (ItemId id : m_multiSelected) {
            m_surface->deleteItem(id);
            m_registry.remove(id);
        }
        qDebug() << "ShapeController: Deleted" << m_multiSelected.size() << "multi-selected shapes";
        m_multiSelected.clear();
        emit multiSelectionChanged();
    } else if (m_selected) {
        m_surface->deleteItem(*m_selected);
        m_registry.remove(*m_selected);
        qDebug() << "ShapeController: Deleted shape" << *m_selected;
    } else {
        qDebug() << "ShapeController: Nothing selected to delete";
        return;
    }

    if (const Shape *last = m_registry.last()) {
        setSelected(last->id);
        reportCenter(last->id);
    } else {
        setSelected(std::nullopt);
        m_surface->removeText(QString::fromLatin1(Readouts::kCenterTag));
    }
}

bool ShapeController::recolorNearest(const QColor &color)
{
    std::optional<ItemId> found = nearestShape(m_lastPointerPos);
    if (!found) {
        qDebug() << "ShapeController: No shape found near" << m_lastPointerPos << "to recolor";
        return false;
    }

    if (Shape *shape = m_registry.find(*found)) {
        shape->outlineColor = color;
    }
    // Multi-selected shapes keep their indicator until released
    if (!m_multiSelected.contains(*found)) {
        m_surface->setOutlineColor(*found, color);
    }
    return true;
}

void ShapeController::revealSelected()
{
    if (!m_selected) {
        return;
    }
    flash(*m_selected);
}

// ============================================================================
// Helpers
// ============================================================================

QVector<ItemId> ShapeController::targets() const
{
    if (!m_multiSelected.isEmpty()) {
        return m_multiSelected;
    }
    if (m_selected) {
        return {*m_selected};
    }
    return {};
}

std::optional<ItemId> ShapeController::primaryShape() const
{
    if (!m_multiSelected.isEmpty()) {
        return m_multiSelected.last();
    }
    return m_selected;
}

std::optional<ItemId> ShapeController::nearestShape(const QPoint &pos) const
{
    std::optional<ItemId> found = m_surface->findClosest(pos, m_halo);
    if (found && !m_registry.contains(*found)) {
        return std::nullopt;
    }
    return found;
}

void ShapeController::setSelected(std::optional<ItemId> id)
{
    if (m_selected == id) {
        return;
    }
    m_selected = id;
    emit selectionChanged();
}

void ShapeController::clearMultiSelection()
{
    if (m_multiSelected.isEmpty()) {
        return;
    }

    for (ItemId id : m_multiSelected) {
        if (const Shape *shape = m_registry.find(id)) {
            m_surface->setOutlineColor(id, shape->outlineColor);
        }
    }
    m_multiSelected.clear();
    emit multiSelectionChanged();
}

void ShapeController::clearHighlights()
{
    for (const Shape &shape : m_registry.shapes()) {
        m_surface->setFillColor(shape.id, QColor());
    }
}

void ShapeController::flash(ItemId id)
{
    m_surface->setFillColor(id, m_highlightColor);

    IDrawingSurface *surface = m_surface;
    m_surface->scheduleOnce(m_flashDuration, [surface, id]() {
        // The shape may have been deleted while the flash was showing
        if (surface->contains(id)) {
            surface->setFillColor(id, QColor());
        }
    });
}

void ShapeController::syncCenter(Shape &shape)
{
    QRectF rect = m_surface->itemRect(shape.id);
    if (!rect.isNull()) {
        shape.center = rect.center();
    }
}

void ShapeController::reportCenter(ItemId id)
{
    const Shape *shape = m_registry.find(id);
    if (!shape) {
        return;
    }
    Readouts::showCenter(m_surface, shape->center, shape->outlineColor);
    emit centerReported(shape->center);
}
