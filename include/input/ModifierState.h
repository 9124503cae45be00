#ifndef MODIFIERSTATE_H
#define MODIFIERSTATE_H

#include <Qt>

/**
 * @brief Modifier bitmask shared by pointer and keyboard bindings.
 *
 * Values follow the X11 event state: Shift = 1, Caps Lock = 2,
 * Control = 4, Alt = 8.
 */
namespace ModifierState {

constexpr int None = 0;
constexpr int Shift = 1;
constexpr int CapsLock = 2;
constexpr int Control = 4;
constexpr int Alt = 8;
constexpr int ShiftControl = Shift | Control;

// Caps Lock never changes what a binding does
constexpr int normalize(int state)
{
    return state & ~CapsLock;
}

inline int fromQt(Qt::KeyboardModifiers modifiers)
{
    int state = None;
    if (modifiers & Qt::ShiftModifier) {
        state |= Shift;
    }
    if (modifiers & Qt::ControlModifier) {
        state |= Control;
    }
    if (modifiers & Qt::AltModifier) {
        state |= Alt;
    }
    return state;
}

} // namespace ModifierState

#endif // MODIFIERSTATE_H
