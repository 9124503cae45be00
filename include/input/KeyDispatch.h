#ifndef KEYDISPATCH_H
#define KEYDISPATCH_H

#include <QString>

class CanvasRegistry;

/**
 * @brief Keyboard commands understood by a canvas panel.
 */
enum class KeyAction {
    None = 0,

    // Shape location nudges
    NudgeUp,
    NudgeDown,
    NudgeLeft,
    NudgeRight,

    // Shape size nudges
    Grow,
    Shrink,

    Duplicate,
    Delete,
    ReleaseMultiSelection,
    RecolorBlack,
    RevealSelected,

    // Drawing canvases
    EraseLastPolyline,
    EraseLastFreehand,
    EraseAllFreehand,
    EraseAllPolyline,

    // Next shape kind
    NextOval,
    NextRectangle,
    NextArc
};

namespace KeyDispatch {

/**
 * @brief Map a modifier bitmask and key name to an action.
 *
 * keysym is "Up", "Down", "Left", "Right" or a single letter. Caps Lock
 * is ignored and letters match case-insensitively. Unbound combinations
 * return KeyAction::None.
 */
KeyAction resolveKeyAction(int modifiers, const QString &keysym);

/**
 * @brief Key name for a Qt key code, or an empty string if unbound.
 */
QString keysymFromQt(int key);

/**
 * @brief Run action against the canvases known to registry.
 *
 * Shape commands go to the registry's active shape canvas; erase
 * commands fan out to every drawing canvas of the matching sub-mode.
 * @return false if the action had no target
 */
bool applyKeyAction(KeyAction action, CanvasRegistry *registry);

const char* actionName(KeyAction action);

} // namespace KeyDispatch

#endif // KEYDISPATCH_H
