#ifndef LINESEGMENTITEM_H
#define LINESEGMENTITEM_H

#include "CanvasItem.h"

#include <QLineF>

/**
 * @brief Straight line segment used by freehand and polyline drawing.
 */
class LineSegmentItem : public CanvasItem
{
public:
    LineSegmentItem(const QPointF &from, const QPointF &to, const QColor &color, int width);

    void draw(QPainter &painter) const override;
    QRectF boundingRect() const override;
    qreal distanceTo(const QPointF &pos) const override;
    void translate(const QPointF &delta) override;
    void scale(const QPointF &anchor, qreal factor) override;

    QLineF line() const { return m_line; }
    int width() const { return m_width; }

private:
    QLineF m_line;
    int m_width;
};

#endif // LINESEGMENTITEM_H
