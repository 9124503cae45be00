#include "canvas/CanvasPanel.h"
#include "canvas/CanvasConfig.h"
#include "canvas/CanvasRegistry.h"
#include "canvas/DrawCanvas.h"
#include "canvas/ShapeCanvas.h"
#include "input/KeyDispatch.h"
#include "input/ModifierState.h"

#include <QDebug>
#include <QHBoxLayout>
#include <QKeyEvent>

CanvasPanel::CanvasPanel(QWidget *parent)
    : QWidget(parent)
    , m_registry(new CanvasRegistry(this))
    , m_layout(new QHBoxLayout(this))
{
    setFocusPolicy(Qt::StrongFocus);
}

CanvasPanel::~CanvasPanel() = default;

DrawCanvas* CanvasPanel::addDrawCanvas(DrawMode mode)
{
    auto *canvas = new DrawCanvas(CanvasConfig::fromSettings(mode), m_registry, this);
    m_layout->addWidget(canvas);
    return canvas;
}

ShapeCanvas* CanvasPanel::addShapeCanvas()
{
    auto *canvas = new ShapeCanvas(CanvasConfig::fromSettings(), m_registry, this);
    m_layout->addWidget(canvas);
    return canvas;
}

void CanvasPanel::keyPressEvent(QKeyEvent *event)
{
    const QString keysym = KeyDispatch::keysymFromQt(event->key());
    if (keysym.isEmpty()) {
        QWidget::keyPressEvent(event);
        return;
    }

    KeyAction action = KeyDispatch::resolveKeyAction(
        ModifierState::fromQt(event->modifiers()), keysym);
    if (KeyDispatch::applyKeyAction(action, m_registry)) {
        qDebug() << "CanvasPanel: Applied" << KeyDispatch::actionName(action);
        event->accept();
        return;
    }

    QWidget::keyPressEvent(event);
}
