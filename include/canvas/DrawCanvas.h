#ifndef DRAWCANVAS_H
#define DRAWCANVAS_H

#include <QWidget>

#include "canvas/CanvasConfig.h"

class QMouseEvent;
class QPaintEvent;
class CanvasRegistry;
class DrawController;
class ItemLayer;

/**
 * @brief Widget hosting one freehand or polyline drawing canvas.
 *
 * Forwards Qt mouse events to its DrawController and paints the item
 * layer plus the in-progress preview.
 */
class DrawCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit DrawCanvas(const CanvasConfig &config, CanvasRegistry *registry = nullptr,
                        QWidget *parent = nullptr);
    ~DrawCanvas() override;

    DrawController* controller() const { return m_controller; }
    ItemLayer* layer() const { return m_layer; }
    const CanvasConfig& config() const { return m_config; }

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void leaveEvent(QEvent *event) override;

private:
    CanvasConfig m_config;
    ItemLayer *m_layer;
    DrawController *m_controller;
};

#endif // DRAWCANVAS_H
