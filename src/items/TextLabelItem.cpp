#include "items/TextLabelItem.h"

#include <QFont>
#include <QFontMetricsF>
#include <QLineF>
#include <QPainter>

TextLabelItem::TextLabelItem(const QPointF &anchor, const QString &text,
                             const QColor &color, Qt::Alignment alignment)
    : CanvasItem(color)
    , m_anchor(anchor)
    , m_text(text)
    , m_alignment(alignment)
{
}

QRectF TextLabelItem::textRect() const
{
    QFontMetricsF metrics{QFont()};
    QSizeF size(metrics.horizontalAdvance(m_text), metrics.height());

    QRectF rect(QPointF(0, 0), size);
    if (m_alignment & Qt::AlignLeft) {
        rect.moveTopLeft(QPointF(m_anchor.x(), m_anchor.y() - size.height() / 2.0));
    } else {
        rect.moveCenter(m_anchor);
    }
    return rect;
}

void TextLabelItem::draw(QPainter &painter) const
{
    painter.save();
    painter.setPen(m_outlineColor);
    painter.drawText(textRect(), Qt::AlignLeft | Qt::AlignVCenter, m_text);
    painter.restore();
}

QRectF TextLabelItem::boundingRect() const
{
    return textRect();
}

qreal TextLabelItem::distanceTo(const QPointF &pos) const
{
    return QLineF(textRect().center(), pos).length();
}

void TextLabelItem::translate(const QPointF &delta)
{
    m_anchor += delta;
}

void TextLabelItem::scale(const QPointF &anchor, qreal factor)
{
    // Text keeps its size, only its position follows the scale
    m_anchor = scalePoint(m_anchor, anchor, factor);
}
