#ifndef CANVASITEM_H
#define CANVASITEM_H

#include <QColor>
#include <QPainter>
#include <QPointF>
#include <QRectF>
#include <memory>

// Surface-assigned handle for a rendered primitive. Never reused while the
// owning layer lives.
using ItemId = int;

/**
 * @brief Abstract base class for every primitive rendered on a canvas.
 */
class CanvasItem
{
public:
    virtual ~CanvasItem() = default;
    virtual void draw(QPainter &painter) const = 0;
    virtual QRectF boundingRect() const = 0;

    // Distance from pos to the item, 0 when pos is on or inside it
    virtual qreal distanceTo(const QPointF &pos) const = 0;

    virtual void translate(const QPointF &delta) = 0;
    virtual void scale(const QPointF &anchor, qreal factor) = 0;

    // Items that can be picked by nearest-item lookup
    virtual bool isHittable() const { return true; }

    // Only box-shaped items accept an absolute rect
    virtual bool setRect(const QRectF &rect) { Q_UNUSED(rect); return false; }

    void setOutlineColor(const QColor &color) { m_outlineColor = color; }
    QColor outlineColor() const { return m_outlineColor; }

    // An invalid color means "no fill"
    void setFillColor(const QColor &color) { m_fillColor = color; }
    QColor fillColor() const { return m_fillColor; }

protected:
    explicit CanvasItem(const QColor &outline) : m_outlineColor(outline) {}

    static QPointF scalePoint(const QPointF &point, const QPointF &anchor, qreal factor)
    {
        return anchor + (point - anchor) * factor;
    }

    QColor m_outlineColor;
    QColor m_fillColor;
};

#endif // CANVASITEM_H
