#include "canvas/DrawCanvas.h"
#include "input/ModifierState.h"
#include "items/ItemLayer.h"
#include "tools/DrawController.h"

#include <QDebug>
#include <QMouseEvent>
#include <QPainter>

DrawCanvas::DrawCanvas(const CanvasConfig &config, CanvasRegistry *registry, QWidget *parent)
    : QWidget(parent)
    , m_config(config)
    , m_layer(new ItemLayer(this))
    , m_controller(nullptr)
{
    m_controller = new DrawController(config.drawMode, m_layer, registry, this);
    m_controller->setCanvasSize(config.size);
    m_controller->setColor(config.lineColor);
    m_controller->setWidth(config.lineWidth);

    setFixedSize(config.size);
    setMouseTracking(true);
    setCursor(m_controller->handler()->cursor());
    // Keyboard commands are handled by the hosting panel
    setFocusPolicy(Qt::NoFocus);

    connect(m_layer, &ItemLayer::changed, this, QOverload<>::of(&QWidget::update));
    connect(m_controller, &DrawController::needsRepaint, this, QOverload<>::of(&QWidget::update));

    qDebug() << "DrawCanvas: Created" << drawModeName(config.drawMode) << "canvas" << config.size;
}

DrawCanvas::~DrawCanvas() = default;

void DrawCanvas::paintEvent(QPaintEvent *)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    painter.fillRect(rect(), m_config.backgroundColor);

    // Draw completed segments and readouts
    m_layer->draw(painter);

    // Draw segment in progress (preview)
    m_controller->drawCurrentPreview(painter);
}

void DrawCanvas::mousePressEvent(QMouseEvent *event)
{
    m_controller->handleMousePress(event->pos(), event->button(),
                                   ModifierState::fromQt(event->modifiers()));
}

void DrawCanvas::mouseMoveEvent(QMouseEvent *event)
{
    m_controller->handleMouseMove(event->pos(), event->buttons(),
                                  ModifierState::fromQt(event->modifiers()));
}

void DrawCanvas::mouseReleaseEvent(QMouseEvent *event)
{
    m_controller->handleMouseRelease(event->pos(), event->button(),
                                     ModifierState::fromQt(event->modifiers()));
}

void DrawCanvas::mouseDoubleClickEvent(QMouseEvent *event)
{
    m_controller->handleDoubleClick(event->pos(), event->button(),
                                    ModifierState::fromQt(event->modifiers()));
}

void DrawCanvas::leaveEvent(QEvent *event)
{
    m_controller->handleLeave();
    QWidget::leaveEvent(event);
}
