#pragma once

// ============================================================================
// HitTesting - Annotation picking, resize handles and resize geometry
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// All coordinates are content coordinates. Handle anchors are the centers
// of the 8x8 handle squares drawn by AnnotationRenderer.
// ============================================================================

#include "../annotations/AnnotationCollection.h"

#include <QPointF>
#include <QRectF>
#include <Qt>

enum class ResizeHandle { None, NW, NE, SW, SE };

/**
 * @brief What a select-mode click does besides selecting.
 */
enum class ClickAction {
    None,
    ToggleCheckbox,   ///< Flip the checkbox state
    SelectRadio       ///< Check the radio, uncheck its group
};

namespace HitTesting {

constexpr qreal HANDLE_OFFSET = 4.0;      ///< Handles sit 4 px outside the box
constexpr qreal HANDLE_TOLERANCE = 12.0;  ///< |dx| and |dy| below this hit a handle
constexpr qreal MIN_RESIZE_SIZE = 20.0;   ///< Smallest box reachable by resizing

/**
 * @brief Topmost annotation on the page whose box contains pt.
 *
 * Searches in reverse paint order; containment is inclusive.
 * @return nullptr when nothing is hit.
 */
const Annotation* hitTest(const AnnotationCollection& annotations, int page, const QPointF& pt);

/**
 * @brief Handle anchor (center of the handle square) for a corner.
 */
QPointF handleAnchor(const QRectF& bounds, ResizeHandle handle);

/**
 * @brief Which handle of bounds is under pt, checked nw, ne, sw, se.
 */
ResizeHandle resizeHandleAt(const QRectF& bounds, const QPointF& pt);

/**
 * @brief New bounds when dragging a handle to pt.
 *
 * The edges opposite the handle stay fixed; width and height never drop
 * below minSize.
 */
QRectF resizedBounds(const QRectF& bounds, ResizeHandle handle, const QPointF& pt,
                     qreal minSize = MIN_RESIZE_SIZE);

/**
 * @brief Hover cursor in select mode.
 */
Qt::CursorShape cursorFor(ResizeHandle handle, bool insideSelection);

ClickAction clickActionFor(AnnotationType type);

} // namespace HitTesting
