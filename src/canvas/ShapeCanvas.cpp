#include "canvas/ShapeCanvas.h"
#include "input/ModifierState.h"
#include "items/ItemLayer.h"
#include "settings/CanvasSettingsManager.h"
#include "shapes/ShapeController.h"

#include <QDebug>
#include <QMouseEvent>
#include <QPainter>

ShapeCanvas::ShapeCanvas(const CanvasConfig &config, CanvasRegistry *registry, QWidget *parent)
    : QWidget(parent)
    , m_config(config)
    , m_layer(new ItemLayer(this))
    , m_controller(nullptr)
{
    const auto &settings = CanvasSettingsManager::instance();

    m_controller = new ShapeController(m_layer, registry, this);
    m_controller->setCanvasSize(config.size);
    m_controller->setLineColor(config.lineColor);
    m_controller->setLineWidth(config.lineWidth);
    m_controller->setHalo(settings.loadHalo());
    m_controller->setHighlightColor(settings.loadHighlightColor());
    m_controller->setFlashDuration(settings.loadFlashDuration());
    m_controller->setNextShapeKind(settings.loadNextShapeKind());

    setFixedSize(config.size);
    setMouseTracking(true);
    setFocusPolicy(Qt::NoFocus);

    connect(m_layer, &ItemLayer::changed, this, QOverload<>::of(&QWidget::update));
}

ShapeCanvas::~ShapeCanvas() = default;

void ShapeCanvas::paintEvent(QPaintEvent *)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    painter.fillRect(rect(), m_config.backgroundColor);
    m_layer->draw(painter);
}

void ShapeCanvas::mousePressEvent(QMouseEvent *event)
{
    m_controller->handleMousePress(event->pos(), event->button(),
                                   ModifierState::fromQt(event->modifiers()));
}

void ShapeCanvas::mouseMoveEvent(QMouseEvent *event)
{
    m_controller->handleMouseMove(event->pos(), ModifierState::fromQt(event->modifiers()));
}

void ShapeCanvas::mouseDoubleClickEvent(QMouseEvent *event)
{
    // Each press of a double-click already reached mousePressEvent
    Q_UNUSED(event);
}

void ShapeCanvas::leaveEvent(QEvent *event)
{
    m_controller->handleLeave();
    QWidget::leaveEvent(event);
}
