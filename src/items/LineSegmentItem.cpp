#include "items/LineSegmentItem.h"

#include <QPainter>
#include <QtMath>

LineSegmentItem::LineSegmentItem(const QPointF &from, const QPointF &to,
                                 const QColor &color, int width)
    : CanvasItem(color)
    , m_line(from, to)
    , m_width(width)
{
}

void LineSegmentItem::draw(QPainter &painter) const
{
    painter.save();
    QPen pen(m_outlineColor, m_width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(pen);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.drawLine(m_line);
    painter.restore();
}

QRectF LineSegmentItem::boundingRect() const
{
    return QRectF(m_line.p1(), m_line.p2()).normalized();
}

qreal LineSegmentItem::distanceTo(const QPointF &pos) const
{
    const QPointF d = m_line.p2() - m_line.p1();
    const qreal lengthSquared = d.x() * d.x() + d.y() * d.y();
    if (qFuzzyIsNull(lengthSquared)) {
        return QLineF(m_line.p1(), pos).length();
    }

    // Project onto the segment and clamp to its endpoints
    const QPointF rel = pos - m_line.p1();
    qreal t = (rel.x() * d.x() + rel.y() * d.y()) / lengthSquared;
    t = qBound(0.0, t, 1.0);
    const QPointF closest = m_line.p1() + d * t;

    qreal distance = QLineF(closest, pos).length() - m_width / 2.0;
    return qMax(0.0, distance);
}

void LineSegmentItem::translate(const QPointF &delta)
{
    m_line.translate(delta);
}

void LineSegmentItem::scale(const QPointF &anchor, qreal factor)
{
    m_line = QLineF(scalePoint(m_line.p1(), anchor, factor),
                    scalePoint(m_line.p2(), anchor, factor));
}
