#ifndef READOUTS_H
#define READOUTS_H

#include <QColor>
#include <QtGlobal>
#include <QPoint>
#include <QPointF>
#include <QSize>
#include <QString>

#include "canvas/IDrawingSurface.h"

/**
 * @brief Text readouts shared by draw and shape canvases.
 */
namespace Readouts {

inline constexpr const char* kCursorTag = "cursor_text";
inline constexpr const char* kCenterTag = "center_text";

// Cursor position, lower right corner of the canvas
inline void showCursorPosition(IDrawingSurface* surface, const QSize& canvasSize, const QPoint& pos)
{
    if (!surface) {
        return;
    }
    surface->showText(QString::fromLatin1(kCursorTag),
                      QPointF(canvasSize.width() - 28, canvasSize.height() - 10),
                      QStringLiteral("%1,%2").arg(pos.x()).arg(pos.y()),
                      Qt::blue, Qt::AlignCenter);
}

inline void clearCursorPosition(IDrawingSurface* surface)
{
    if (surface) {
        surface->removeText(QString::fromLatin1(kCursorTag));
    }
}

inline QString formatCenter(const QPointF& center)
{
    // Centers are whole pixels unless a resize made them fractional
    auto format = [](qreal v) {
        return qAbs(v - qRound(v)) < 0.05 ? QString::number(qRound(v))
                                          : QString::number(v, 'f', 1);
    };
    return QStringLiteral("%1, %2").arg(format(center.x()), format(center.y()));
}

// Shape center, upper left corner, drawn in the shape's color
inline void showCenter(IDrawingSurface* surface, const QPointF& center, const QColor& color)
{
    if (!surface) {
        return;
    }
    surface->showText(QString::fromLatin1(kCenterTag), QPointF(10, 12),
                      formatCenter(center), color, Qt::AlignLeft);
}

} // namespace Readouts

#endif // READOUTS_H
