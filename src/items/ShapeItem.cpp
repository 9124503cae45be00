#include "items/ShapeItem.h"

#include <QPainter>
#include <QPainterPath>
#include <QtMath>

ShapeItem::ShapeItem(ShapeKind kind, const QRectF &rect, const QColor &outline, int width)
    : CanvasItem(outline)
    , m_kind(kind)
    , m_rect(rect.normalized())
    , m_width(width)
{
}

void ShapeItem::draw(QPainter &painter) const
{
    painter.save();

    QPen pen(m_outlineColor, m_width, Qt::SolidLine, Qt::SquareCap, Qt::MiterJoin);
    painter.setPen(pen);
    painter.setRenderHint(QPainter::Antialiasing, true);

    if (m_fillColor.isValid()) {
        painter.setBrush(m_fillColor);
    } else {
        painter.setBrush(Qt::NoBrush);
    }

    switch (m_kind) {
    case ShapeKind::Oval:
        painter.drawEllipse(m_rect);
        break;
    case ShapeKind::Rectangle:
        painter.drawRect(m_rect);
        break;
    case ShapeKind::Arc:
        // QPainter angles are in 1/16th of a degree
        painter.drawPie(m_rect, kArcStartAngle * 16, kArcSpanAngle * 16);
        break;
    }

    painter.restore();
}

QRectF ShapeItem::boundingRect() const
{
    qreal margin = m_width / 2.0 + 1;
    return m_rect.adjusted(-margin, -margin, margin, margin);
}

QPainterPath ShapeItem::outlinePath() const
{
    QPainterPath path;
    switch (m_kind) {
    case ShapeKind::Oval:
        path.addEllipse(m_rect);
        break;
    case ShapeKind::Rectangle:
        path.addRect(m_rect);
        break;
    case ShapeKind::Arc:
        path.moveTo(m_rect.center());
        path.arcTo(m_rect, kArcStartAngle, kArcSpanAngle);
        path.closeSubpath();
        break;
    }
    return path;
}

qreal ShapeItem::distanceTo(const QPointF &pos) const
{
    QPainterPath path = outlinePath();
    if (path.contains(pos)) {
        return 0.0;
    }

    // Outside the shape: distance to its box is close enough for picking
    const QRectF box = path.boundingRect();
    qreal dx = qMax(qMax(box.left() - pos.x(), 0.0), pos.x() - box.right());
    qreal dy = qMax(qMax(box.top() - pos.y(), 0.0), pos.y() - box.bottom());
    return qSqrt(dx * dx + dy * dy);
}

void ShapeItem::translate(const QPointF &delta)
{
    m_rect.translate(delta);
}

void ShapeItem::scale(const QPointF &anchor, qreal factor)
{
    m_rect = QRectF(scalePoint(m_rect.topLeft(), anchor, factor),
                    scalePoint(m_rect.bottomRight(), anchor, factor)).normalized();
}

bool ShapeItem::setRect(const QRectF &rect)
{
    m_rect = rect.normalized();
    return true;
}
