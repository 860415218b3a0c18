#pragma once

// ============================================================================
// CoordinateTransform - Client (screen) <-> page content coordinates
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Content coordinates are the pixel grid of the page bitmap rendered at the
// fixed render scale, without zoom and without device pixel ratio. Every
// annotation is stored in content coordinates.
//
// The overlay widget is displayed at some on-screen rect whose size is
// contentSize * zoom. Mapping a client point therefore only needs that
// rect and the zoom-free content size:
//
//   scaleX = contentWidth  / rect.width
//   scaleY = contentHeight / rect.height
//   content = (client - rect.topLeft) * scale
//
// Device pixel ratio never enters this math; it only sizes raster buffers.
// ============================================================================

#include "PointerEvent.h"

#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

class CoordinateTransform {
public:
    CoordinateTransform() = default;

    /**
     * @param overlayRect On-screen rect of the overlay in client coordinates.
     * @param contentSize Zoom-free size of the rendered page.
     */
    CoordinateTransform(const QRectF& overlayRect, const QSizeF& contentSize)
        : m_overlayRect(overlayRect), m_contentSize(contentSize) {}

    void setOverlayRect(const QRectF& rect) { m_overlayRect = rect; }
    QRectF overlayRect() const { return m_overlayRect; }

    void setContentSize(const QSizeF& size) { m_contentSize = size; }
    QSizeF contentSize() const { return m_contentSize; }

    /**
     * @brief True when both rects are non-degenerate and mapping is defined.
     */
    bool isValid() const;

    qreal scaleX() const;
    qreal scaleY() const;

    /**
     * @brief Map a pointer sample to content coordinates.
     * @param event Mouse or touch sample.
     * @param ok Optional; set to false if the event has no coordinates or
     *           the transform is degenerate. The origin is returned then.
     */
    QPointF toContentCoords(const PointerEvent& event, bool* ok = nullptr) const;

    QPointF toContent(const QPointF& clientPos) const;

    /**
     * @brief Inverse mapping, used to position widgets over annotations.
     */
    QPointF toClient(const QPointF& contentPos) const;
    QRectF toClient(const QRectF& contentRect) const;

    /**
     * @brief Physical pixel size of a raster buffer backing contentSize.
     */
    static QSize bufferSize(const QSizeF& contentSize, qreal devicePixelRatio);

private:
    QRectF m_overlayRect;
    QSizeF m_contentSize;
};
