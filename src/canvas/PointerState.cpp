#include "canvas/PointerState.h"

void PointerState::recordClick(const QPoint& point)
{
    if (!m_first) {
        m_first = point;
        m_previous = point;
    } else {
        m_previous = m_start;
    }

    m_start = point;
    m_history.append(point);
}

bool PointerState::popLastPoint()
{
    if (m_history.isEmpty()) {
        return false;
    }

    m_history.removeLast();
    if (m_history.isEmpty()) {
        reset();
    } else {
        m_start = m_history.last();
    }
    return true;
}

void PointerState::reset()
{
    m_first.reset();
    m_history.clear();
}
