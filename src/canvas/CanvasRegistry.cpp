#include "canvas/CanvasRegistry.h"
#include "tools/DrawController.h"
#include "shapes/ShapeController.h"

#include <QDebug>

CanvasRegistry::CanvasRegistry(QObject *parent)
    : QObject(parent)
{
}

CanvasRegistry::~CanvasRegistry() = default;

void CanvasRegistry::registerDrawController(DrawController *controller)
{
    if (!controller || m_drawControllers.contains(controller)) {
        return;
    }
    m_drawControllers.append(controller);
    qDebug() << "CanvasRegistry: Registered" << drawModeName(controller->mode()) << "canvas";
}

void CanvasRegistry::unregisterDrawController(DrawController *controller)
{
    m_drawControllers.removeAll(controller);
}

void CanvasRegistry::registerShapeController(ShapeController *controller)
{
    if (!controller || m_shapeControllers.contains(controller)) {
        return;
    }
    m_shapeControllers.append(controller);
    qDebug() << "CanvasRegistry: Registered shape canvas";
}

void CanvasRegistry::unregisterShapeController(ShapeController *controller)
{
    m_shapeControllers.removeAll(controller);
    if (m_activeShapeController == controller) {
        m_activeShapeController.clear();
    }
}

QVector<DrawController*> CanvasRegistry::drawControllers(DrawMode mode) const
{
    QVector<DrawController*> result;
    for (const auto &controller : m_drawControllers) {
        if (controller && controller->mode() == mode) {
            result.append(controller.data());
        }
    }
    return result;
}

QVector<ShapeController*> CanvasRegistry::shapeControllers() const
{
    QVector<ShapeController*> result;
    for (const auto &controller : m_shapeControllers) {
        if (controller) {
            result.append(controller.data());
        }
    }
    return result;
}

void CanvasRegistry::eraseLastRun(DrawMode mode)
{
    for (DrawController *controller : drawControllers(mode)) {
        controller->eraseLastRun();
    }
}

void CanvasRegistry::eraseAll(DrawMode mode)
{
    for (DrawController *controller : drawControllers(mode)) {
        controller->eraseAll();
    }
}

ShapeController* CanvasRegistry::activeShapeController() const
{
    if (m_activeShapeController) {
        return m_activeShapeController.data();
    }
    for (const auto &controller : m_shapeControllers) {
        if (controller) {
            return controller.data();
        }
    }
    return nullptr;
}

void CanvasRegistry::setActiveShapeController(ShapeController *controller)
{
    m_activeShapeController = controller;
}
