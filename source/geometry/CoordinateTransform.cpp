// ============================================================================
// CoordinateTransform - Implementation
// ============================================================================

#include "CoordinateTransform.h"

#include <QtMath>

bool CoordinateTransform::isValid() const
{
    return m_overlayRect.width() > 0 && m_overlayRect.height() > 0
        && m_contentSize.width() > 0 && m_contentSize.height() > 0;
}

qreal CoordinateTransform::scaleX() const
{
    return isValid() ? m_contentSize.width() / m_overlayRect.width() : 1.0;
}

qreal CoordinateTransform::scaleY() const
{
    return isValid() ? m_contentSize.height() / m_overlayRect.height() : 1.0;
}

QPointF CoordinateTransform::toContentCoords(const PointerEvent& event, bool* ok) const
{
    QPointF clientPos;
    if (!event.resolveClientPos(&clientPos) || !isValid()) {
        if (ok) {
            *ok = false;
        }
        return QPointF(0, 0);
    }
    if (ok) {
        *ok = true;
    }
    return toContent(clientPos);
}

QPointF CoordinateTransform::toContent(const QPointF& clientPos) const
{
    if (!isValid()) {
        return QPointF(0, 0);
    }
    return QPointF((clientPos.x() - m_overlayRect.left()) * scaleX(),
                   (clientPos.y() - m_overlayRect.top()) * scaleY());
}

QPointF CoordinateTransform::toClient(const QPointF& contentPos) const
{
    if (!isValid()) {
        return m_overlayRect.topLeft();
    }
    return QPointF(m_overlayRect.left() + contentPos.x() / scaleX(),
                   m_overlayRect.top() + contentPos.y() / scaleY());
}

QRectF CoordinateTransform::toClient(const QRectF& contentRect) const
{
    return QRectF(toClient(contentRect.topLeft()), toClient(contentRect.bottomRight()));
}

QSize CoordinateTransform::bufferSize(const QSizeF& contentSize, qreal devicePixelRatio)
{
    qreal dpr = devicePixelRatio > 0 ? devicePixelRatio : 1.0;
    return QSize(qCeil(contentSize.width() * dpr), qCeil(contentSize.height() * dpr));
}
