#ifndef SHAPEKIND_H
#define SHAPEKIND_H

#include <QSize>
#include <QString>

/**
 * @brief Closed set of parametric shapes the shape canvas can create.
 */
enum class ShapeKind {
    Oval = 0,
    Rectangle = 1,
    Arc = 2
};

namespace ShapeKinds {

// Half width / half height of a freshly created shape, centred on the click.
inline QSize defaultHalfSize(ShapeKind kind)
{
    switch (kind) {
    case ShapeKind::Oval:      return QSize(20, 25);
    case ShapeKind::Rectangle: return QSize(25, 20);
    case ShapeKind::Arc:       return QSize(30, 25);
    }
    return QSize(20, 25);
}

inline QString name(ShapeKind kind)
{
    switch (kind) {
    case ShapeKind::Oval:      return QStringLiteral("oval");
    case ShapeKind::Rectangle: return QStringLiteral("rectangle");
    case ShapeKind::Arc:       return QStringLiteral("arc");
    }
    return QString();
}

inline bool isValid(int value)
{
    return value >= static_cast<int>(ShapeKind::Oval)
        && value <= static_cast<int>(ShapeKind::Arc);
}

} // namespace ShapeKinds

#endif // SHAPEKIND_H
