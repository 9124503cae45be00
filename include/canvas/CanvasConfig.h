#ifndef CANVASCONFIG_H
#define CANVASCONFIG_H

#include <QColor>
#include <QSize>

#include "tools/DrawMode.h"

/**
 * @brief Construction-time configuration of one canvas widget.
 */
struct CanvasConfig {
    QSize size = QSize(400, 500);
    QColor backgroundColor = QColor(0xff, 0xff, 0xaa);
    DrawMode drawMode = DrawMode::Freehand;
    int lineWidth = 1;
    QColor lineColor = Qt::black;

    /**
     * @brief Config for a canvas of the given sub-mode, filled from the
     * persisted canvas settings.
     */
    static CanvasConfig fromSettings(DrawMode mode = DrawMode::Freehand);
};

#endif // CANVASCONFIG_H
