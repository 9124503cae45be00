#ifndef DRAWMODE_H
#define DRAWMODE_H

#include <QString>

/**
 * @brief Drawing sub-mode of a draw canvas, fixed at construction.
 */
enum class DrawMode {
    Freehand = 0,
    Polyline = 1
};

inline QString drawModeName(DrawMode mode)
{
    return mode == DrawMode::Freehand ? QStringLiteral("freehand")
                                      : QStringLiteral("polyline");
}

#endif // DRAWMODE_H
