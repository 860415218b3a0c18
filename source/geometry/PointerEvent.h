#pragma once

// ============================================================================
// PointerEvent - Unified mouse/touch input sample
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Mouse and touch events arrive in different shapes. The canvas widget
// converts both into this struct before anything else looks at them.
// ============================================================================

#include <QPointF>
#include <QVector>
#include <Qt>

/**
 * @brief A single pointer sample in client (widget) coordinates.
 *
 * Mouse samples carry clientPos. Touch samples carry the list of active
 * touches and, on release, the touches that just ended (changedTouches).
 */
struct PointerEvent {
    enum Type { Press, Move, Release };
    enum Source { Mouse, Touch };

    Type type = Move;
    Source source = Mouse;

    QPointF clientPos;                ///< Mouse position (Mouse source only)
    QVector<QPointF> touches;         ///< Active touch points (Touch source only)
    QVector<QPointF> changedTouches;  ///< Touches that changed in this event

    Qt::MouseButtons buttons = Qt::NoButton;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;

    /**
     * @brief Resolve the client position of this sample.
     * @param out Receives the position when one is available.
     * @return false if the event carries no coordinate source.
     *
     * Touch resolution uses the first active touch, falling back to the
     * first changed touch (end events have no active touches left).
     */
    bool resolveClientPos(QPointF* out) const {
        if (source == Mouse) {
            *out = clientPos;
            return true;
        }
        if (!touches.isEmpty()) {
            *out = touches.first();
            return true;
        }
        if (!changedTouches.isEmpty()) {
            *out = changedTouches.first();
            return true;
        }
        return false;
    }

    static PointerEvent mouse(Type type, const QPointF& pos) {
        PointerEvent ev;
        ev.type = type;
        ev.source = Mouse;
        ev.clientPos = pos;
        return ev;
    }
};
