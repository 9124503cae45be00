#ifndef IDRAWINGSURFACE_H
#define IDRAWINGSURFACE_H

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>
#include <functional>
#include <optional>

#include "items/CanvasItem.h"
#include "shapes/ShapeKind.h"

/**
 * @brief Abstract interface for the primitives a canvas renders.
 *
 * Controllers mutate the picture only through this interface. Every method
 * taking an ItemId tolerates ids that no longer exist: mutators return
 * false and queries return an empty value.
 */
class IDrawingSurface {
public:
    virtual ~IDrawingSurface() = default;

    /**
     * @brief Create a line segment and return its id.
     */
    virtual ItemId createLine(const QPointF& from, const QPointF& to,
                              const QColor& color, int width) = 0;

    /**
     * @brief Create a shape primitive inside bounds and return its id.
     */
    virtual ItemId createShape(ShapeKind kind, const QRectF& bounds,
                               const QColor& outline, int width) = 0;

    virtual bool deleteItem(ItemId id) = 0;
    virtual bool contains(ItemId id) const = 0;

    /**
     * @brief Ids of every rendered primitive, text labels included, in
     * stacking order.
     */
    virtual QVector<ItemId> allItems() const = 0;

    virtual bool moveItem(ItemId id, const QPointF& delta) = 0;
    virtual bool setItemRect(ItemId id, const QRectF& rect) = 0;

    /**
     * @brief Geometry of the item: the bounding box for shapes, the
     * normalized endpoint box for lines. Null rect for unknown ids.
     */
    virtual QRectF itemRect(ItemId id) const = 0;

    virtual bool scaleItem(ItemId id, const QPointF& anchor, qreal factor) = 0;

    virtual bool setOutlineColor(ItemId id, const QColor& color) = 0;
    virtual QColor outlineColor(ItemId id) const = 0;

    /**
     * @brief Set the fill color; an invalid QColor clears the fill.
     */
    virtual bool setFillColor(ItemId id, const QColor& color) = 0;
    virtual QColor fillColor(ItemId id) const = 0;

    /**
     * @brief Find the hittable item nearest pos, if one lies within halo.
     */
    virtual std::optional<ItemId> findClosest(const QPointF& pos, qreal halo) const = 0;

    /**
     * @brief Show a text readout, replacing any previous one with the same tag.
     */
    virtual void showText(const QString& tag, const QPointF& pos, const QString& text,
                          const QColor& color, Qt::Alignment alignment = Qt::AlignCenter) = 0;
    virtual void removeText(const QString& tag) = 0;
    virtual QString text(const QString& tag) const = 0;

    /**
     * @brief Run callback once after delayMs. Fire-and-forget.
     */
    virtual void scheduleOnce(int delayMs, std::function<void()> callback) = 0;
};

#endif // IDRAWINGSURFACE_H
