#ifndef CANVASREGISTRY_H
#define CANVASREGISTRY_H

#include <QObject>
#include <QPointer>
#include <QVector>

#include "tools/DrawMode.h"

class DrawController;
class ShapeController;

/**
 * @brief Broker for the sibling canvases hosted by one panel.
 *
 * Controllers register themselves at construction. Keyboard commands
 * received on the shared ancestor are fanned out through here instead of
 * walking the widget tree.
 */
class CanvasRegistry : public QObject
{
    Q_OBJECT

public:
    explicit CanvasRegistry(QObject *parent = nullptr);
    ~CanvasRegistry() override;

    void registerDrawController(DrawController *controller);
    void unregisterDrawController(DrawController *controller);

    void registerShapeController(ShapeController *controller);
    void unregisterShapeController(ShapeController *controller);

    /**
     * @brief Live draw controllers configured for mode.
     */
    QVector<DrawController*> drawControllers(DrawMode mode) const;

    QVector<ShapeController*> shapeControllers() const;

    // Erase commands for every sibling of the given sub-mode
    void eraseLastRun(DrawMode mode);
    void eraseAll(DrawMode mode);

    /**
     * @brief Shape canvas that receives keyboard shape commands.
     *
     * The last one to see pointer activity; the first registered one
     * until then.
     */
    ShapeController* activeShapeController() const;
    void setActiveShapeController(ShapeController *controller);

private:
    QVector<QPointer<DrawController>> m_drawControllers;
    QVector<QPointer<ShapeController>> m_shapeControllers;
    QPointer<ShapeController> m_activeShapeController;
};

#endif // CANVASREGISTRY_H
