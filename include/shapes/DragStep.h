#ifndef DRAGSTEP_H
#define DRAGSTEP_H

#include <QPoint>
#include <QtGlobal>

namespace DragStep {

inline int sign(int value)
{
    return (value > 0) - (value < 0);
}

/**
 * @brief One-pixel step toward current from previous, per axis.
 *
 * Only the sign of the delta matters, so every shape in a multi-selection
 * moves by the same amount for each motion event.
 *
 * @param previous Pointer position of the previous motion event
 * @param current Pointer position of this motion event
 * @return QPoint with each coordinate in {-1, 0, 1}
 */
inline QPoint unitStep(const QPoint& previous, const QPoint& current)
{
    return QPoint(sign(current.x() - previous.x()),
                  sign(current.y() - previous.y()));
}

/**
 * @brief Axis-locked variant of unitStep.
 *
 * Keeps only the axis whose pixel delta exceeds the other by more than one
 * pixel. Deltas within one pixel of each other give no step at all.
 */
inline QPoint constrainedStep(const QPoint& previous, const QPoint& current)
{
    const int dx = current.x() - previous.x();
    const int dy = current.y() - previous.y();
    const int xDifference = qAbs(dx);
    const int yDifference = qAbs(dy);

    if (xDifference > yDifference + 1) {
        return QPoint(sign(dx), 0);
    }
    if (yDifference > xDifference + 1) {
        return QPoint(0, sign(dy));
    }
    return QPoint(0, 0);
}

} // namespace DragStep

#endif // DRAGSTEP_H
