#ifndef SHAPEREGISTRY_H
#define SHAPEREGISTRY_H

#include <QColor>
#include <QPointF>
#include <QVector>

#include "items/CanvasItem.h"
#include "shapes/ShapeKind.h"

/**
 * @brief Logical record of one shape on the shape canvas.
 */
struct Shape {
    ItemId id = 0;
    ShapeKind kind = ShapeKind::Oval;
    QPointF center;
    QColor outlineColor;
};

/**
 * @brief Creation-ordered list of live shapes.
 *
 * The last entry is the most recently created shape.
 */
class ShapeRegistry
{
public:
    void add(const Shape& shape);
    bool remove(ItemId id);

    Shape* find(ItemId id);
    const Shape* find(ItemId id) const;
    bool contains(ItemId id) const { return find(id) != nullptr; }

    const Shape* last() const;

    bool isEmpty() const { return m_shapes.isEmpty(); }
    int size() const { return m_shapes.size(); }
    const QVector<Shape>& shapes() const { return m_shapes; }
    QVector<ItemId> ids() const;

private:
    QVector<Shape> m_shapes;
};

#endif // SHAPEREGISTRY_H
