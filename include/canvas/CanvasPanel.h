#ifndef CANVASPANEL_H
#define CANVASPANEL_H

#include <QWidget>

#include "tools/DrawMode.h"

class QHBoxLayout;
class QKeyEvent;
class CanvasRegistry;
class DrawCanvas;
class ShapeCanvas;

/**
 * @brief Shared ancestor of a row of sibling canvases.
 *
 * Owns the CanvasRegistry the canvases register with and receives the
 * keyboard events, which are decoded by KeyDispatch.
 */
class CanvasPanel : public QWidget
{
    Q_OBJECT

public:
    explicit CanvasPanel(QWidget *parent = nullptr);
    ~CanvasPanel() override;

    DrawCanvas* addDrawCanvas(DrawMode mode);
    ShapeCanvas* addShapeCanvas();

    CanvasRegistry* registry() const { return m_registry; }

protected:
    void keyPressEvent(QKeyEvent *event) override;

private:
    CanvasRegistry *m_registry;
    QHBoxLayout *m_layout;
};

#endif // CANVASPANEL_H
