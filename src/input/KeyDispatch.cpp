#include "input/KeyDispatch.h"
#include "input/ModifierState.h"
#include "canvas/CanvasRegistry.h"
#include "shapes/ShapeController.h"

#include <QDebug>

namespace {

struct KeyBinding {
    int modifiers;
    const char *keysym;
    KeyAction action;
};

const KeyBinding kKeyBindings[] = {
    {ModifierState::Shift, "Up", KeyAction::NudgeUp},
    {ModifierState::Shift, "Down", KeyAction::NudgeDown},
    {ModifierState::Shift, "Left", KeyAction::NudgeLeft},
    {ModifierState::Shift, "Right", KeyAction::NudgeRight},

    {ModifierState::Control, "Up", KeyAction::Grow},
    {ModifierState::Control, "Down", KeyAction::Shrink},
    {ModifierState::Control, "d", KeyAction::Duplicate},
    {ModifierState::Control, "x", KeyAction::Delete},
    {ModifierState::Control, "r", KeyAction::ReleaseMultiSelection},
    {ModifierState::Control, "l", KeyAction::EraseLastPolyline},
    {ModifierState::Control, "f", KeyAction::EraseLastFreehand},

    {ModifierState::ShiftControl, "f", KeyAction::EraseAllFreehand},
    {ModifierState::ShiftControl, "l", KeyAction::EraseAllPolyline},

    {ModifierState::Alt, "b", KeyAction::RecolorBlack},
    {ModifierState::Alt, "r", KeyAction::RevealSelected},
    {ModifierState::Alt, "o", KeyAction::NextOval},
    {ModifierState::Alt, "t", KeyAction::NextRectangle},
    {ModifierState::Alt, "a", KeyAction::NextArc},
};

bool isArrow(const QString &keysym)
{
    return keysym == QLatin1String("Up") || keysym == QLatin1String("Down")
        || keysym == QLatin1String("Left") || keysym == QLatin1String("Right");
}

} // namespace

namespace KeyDispatch {

KeyAction resolveKeyAction(int modifiers, const QString &keysym)
{
    const int state = ModifierState::normalize(modifiers);

    // Arrow names are case-sensitive, letters are not
    const QString key = isArrow(keysym) ? keysym : keysym.toLower();

    for (const auto &binding : kKeyBindings) {
        if (binding.modifiers == state && key == QLatin1String(binding.keysym)) {
            return binding.action;
        }
    }

    qDebug() << "KeyDispatch: No binding for" << keysym << "with modifiers" << state;
    return KeyAction::None;
}

QString keysymFromQt(int key)
{
    switch (key) {
    case Qt::Key_Up:
        return QStringLiteral("Up");
    case Qt::Key_Down:
        return QStringLiteral("Down");
    case Qt::Key_Left:
        return QStringLiteral("Left");
    case Qt::Key_Right:
        return QStringLiteral("Right");
    default:
        break;
    }

    if (key >= Qt::Key_A && key <= Qt::Key_Z) {
        return QString(QChar('a' + (key - Qt::Key_A)));
    }
    return QString();
}

bool applyKeyAction(KeyAction action, CanvasRegistry *registry)
{
    if (action == KeyAction::None || !registry) {
        return false;
    }

    switch (action) {
    case KeyAction::EraseLastPolyline:
        registry->eraseLastRun(DrawMode::Polyline);
        return true;
    case KeyAction::EraseLastFreehand:
        registry->eraseLastRun(DrawMode::Freehand);
        return true;
    case KeyAction::EraseAllFreehand:
        registry->eraseAll(DrawMode::Freehand);
        return true;
    case KeyAction::EraseAllPolyline:
        registry->eraseAll(DrawMode::Polyline);
        return true;
    default:
        break;
    }

    ShapeController *shapes = registry->activeShapeController();
    if (!shapes) {
        qDebug() << "KeyDispatch: No shape canvas for" << actionName(action);
        return false;
    }

    switch (action) {
    case KeyAction::NudgeUp:
        shapes->nudgeSelection(0, -1);
        break;
    case KeyAction::NudgeDown:
        shapes->nudgeSelection(0, 1);
        break;
    case KeyAction::NudgeLeft:
        shapes->nudgeSelection(-1, 0);
        break;
    case KeyAction::NudgeRight:
        shapes->nudgeSelection(1, 0);
        break;
    case KeyAction::Grow:
        shapes->nudgeSize(1);
        break;
    case KeyAction::Shrink:
        shapes->nudgeSize(-1);
        break;
    case KeyAction::Duplicate:
        shapes->duplicateSelected();
        break;
    case KeyAction::Delete:
        shapes->deleteSelection();
        break;
    case KeyAction::ReleaseMultiSelection:
        shapes->releaseMultiSelection();
        break;
    case KeyAction::RecolorBlack:
        shapes->recolorNearest(Qt::black);
        break;
    case KeyAction::RevealSelected:
        shapes->revealSelected();
        break;
    case KeyAction::NextOval:
        shapes->setNextShapeKind(ShapeKind::Oval);
        break;
    case KeyAction::NextRectangle:
        shapes->setNextShapeKind(ShapeKind::Rectangle);
        break;
    case KeyAction::NextArc:
        shapes->setNextShapeKind(ShapeKind::Arc);
        break;
    default:
        return false;
    }
    return true;
}

const char* actionName(KeyAction action)
{
    switch (action) {
    case KeyAction::None: return "None";
    case KeyAction::NudgeUp: return "NudgeUp";
    case KeyAction::NudgeDown: return "NudgeDown";
    case KeyAction::NudgeLeft: return "NudgeLeft";
    case KeyAction::NudgeRight: return "NudgeRight";
    case KeyAction::Grow: return "Grow";
    case KeyAction::Shrink: return "Shrink";
    case KeyAction::Duplicate: return "Duplicate";
    case KeyAction::Delete: return "Delete";
    case KeyAction::ReleaseMultiSelection: return "ReleaseMultiSelection";
    case KeyAction::RecolorBlack: return "RecolorBlack";
    case KeyAction::RevealSelected: return "RevealSelected";
    case KeyAction::EraseLastPolyline: return "EraseLastPolyline";
    case KeyAction::EraseLastFreehand: return "EraseLastFreehand";
    case KeyAction::EraseAllFreehand: return "EraseAllFreehand";
    case KeyAction::EraseAllPolyline: return "EraseAllPolyline";
    case KeyAction::NextOval: return "NextOval";
    case KeyAction::NextRectangle: return "NextRectangle";
    case KeyAction::NextArc: return "NextArc";
    }
    return "Unknown";
}

} // namespace KeyDispatch
