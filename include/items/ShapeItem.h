#ifndef SHAPEITEM_H
#define SHAPEITEM_H

#include "CanvasItem.h"
#include "shapes/ShapeKind.h"

class QPainterPath;

/**
 * @brief Oval, rectangle or arc primitive defined by its bounding box.
 *
 * Arcs cover the quarter of the bounding ellipse from 90 to 180 degrees
 * and are drawn as a pie slice, so they can be filled like the others.
 */
class ShapeItem : public CanvasItem
{
public:
    ShapeItem(ShapeKind kind, const QRectF &rect, const QColor &outline, int width);

    void draw(QPainter &painter) const override;
    QRectF boundingRect() const override;
    qreal distanceTo(const QPointF &pos) const override;
    void translate(const QPointF &delta) override;
    void scale(const QPointF &anchor, qreal factor) override;
    bool setRect(const QRectF &rect) override;

    QRectF rect() const { return m_rect; }
    ShapeKind kind() const { return m_kind; }
    int width() const { return m_width; }

    static constexpr int kArcStartAngle = 90;
    static constexpr int kArcSpanAngle = 90;

private:
    QPainterPath outlinePath() const;

    ShapeKind m_kind;
    QRectF m_rect;
    int m_width;
};

#endif // SHAPEITEM_H
