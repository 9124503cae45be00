#ifndef TEXTLABELITEM_H
#define TEXTLABELITEM_H

#include "CanvasItem.h"

#include <QString>

/**
 * @brief Read-only text readout (cursor position, shape center).
 *
 * Anchored either at its left edge or at its center, vertically centred on
 * the anchor point. Never picked by nearest-item lookup.
 */
class TextLabelItem : public CanvasItem
{
public:
    TextLabelItem(const QPointF &anchor, const QString &text, const QColor &color,
                  Qt::Alignment alignment = Qt::AlignCenter);

    void draw(QPainter &painter) const override;
    QRectF boundingRect() const override;
    qreal distanceTo(const QPointF &pos) const override;
    void translate(const QPointF &delta) override;
    void scale(const QPointF &anchor, qreal factor) override;
    bool isHittable() const override { return false; }

    QString text() const { return m_text; }
    QPointF anchor() const { return m_anchor; }

private:
    QRectF textRect() const;

    QPointF m_anchor;
    QString m_text;
    Qt::Alignment m_alignment;
};

#endif // TEXTLABELITEM_H
