#include "shapes/ShapeRegistry.h"

#include <algorithm>

void ShapeRegistry::add(const Shape& shape)
{
    m_shapes.append(shape);
}

bool ShapeRegistry::remove(ItemId id)
{
    auto it = std::find_if(m_shapes.begin(), m_shapes.end(),
        [id](const Shape& shape) { return shape.id == id; });
    if (it == m_shapes.end()) {
        return false;
    }
    m_shapes.erase(it);
    return true;
}

Shape* ShapeRegistry::find(ItemId id)
{
    for (Shape& shape : m_shapes) {
        if (shape.id == id) {
            return &shape;
        }
    }
    return nullptr;
}

const Shape* ShapeRegistry::find(ItemId id) const
{
    for (const Shape& shape : m_shapes) {
        if (shape.id == id) {
            return &shape;
        }
    }
    return nullptr;
}

const Shape* ShapeRegistry::last() const
{
    return m_shapes.isEmpty() ? nullptr : &m_shapes.last();
}

QVector<ItemId> ShapeRegistry::ids() const
{
    QVector<ItemId> result;
    result.reserve(m_shapes.size());
    for (const Shape& shape : m_shapes) {
        result.append(shape.id);
    }
    return result;
}
