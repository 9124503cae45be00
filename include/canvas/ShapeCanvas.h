#ifndef SHAPECANVAS_H
#define SHAPECANVAS_H

#include <QWidget>

#include "canvas/CanvasConfig.h"

class QMouseEvent;
class QPaintEvent;
class CanvasRegistry;
class ItemLayer;
class ShapeController;

/**
 * @brief Widget hosting one shape-editing canvas.
 */
class ShapeCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit ShapeCanvas(const CanvasConfig &config, CanvasRegistry *registry = nullptr,
                         QWidget *parent = nullptr);
    ~ShapeCanvas() override;

    ShapeController* controller() const { return m_controller; }
    ItemLayer* layer() const { return m_layer; }

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void leaveEvent(QEvent *event) override;

private:
    CanvasConfig m_config;
    ItemLayer *m_layer;
    ShapeController *m_controller;
};

#endif // SHAPECANVAS_H
