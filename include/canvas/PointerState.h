#ifndef POINTERSTATE_H
#define POINTERSTATE_H

#include <QPoint>
#include <QVector>
#include <optional>

/**
 * @brief Click history of one interaction sequence on a canvas.
 *
 * A sequence is active from the first recorded click until reset().
 * first() is empty while no sequence is active.
 */
class PointerState
{
public:
    /**
     * @brief Record a click.
     *
     * Begins a sequence when none is active (first = previous = point),
     * otherwise shifts previous to the last start. Always sets start and
     * appends the point to the history.
     */
    void recordClick(const QPoint& point);

    /**
     * @brief Update previous only; used as the reference for drag deltas.
     */
    void trackMotion(const QPoint& point) { m_previous = point; }

    /**
     * @brief Drop the last recorded point.
     *
     * Start moves back to the new last point. When the history becomes
     * empty the sequence ends.
     * @return false if there was nothing to pop
     */
    bool popLastPoint();

    void reset();

    bool isActive() const { return m_first.has_value(); }
    std::optional<QPoint> first() const { return m_first; }
    QPoint start() const { return m_start; }
    QPoint previous() const { return m_previous; }
    const QVector<QPoint>& history() const { return m_history; }

private:
    std::optional<QPoint> m_first;
    QPoint m_start;
    QPoint m_previous;
    QVector<QPoint> m_history;
};

#endif // POINTERSTATE_H
