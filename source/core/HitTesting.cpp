#include "HitTesting.h"

#include <QtMath>

namespace HitTesting {

const Annotation* hitTest(const AnnotationCollection& annotations, int page, const QPointF& pt)
{
    for (int i = annotations.size() - 1; i >= 0; --i) {
        const Annotation* annotation = annotations.at(i);
        if (annotation->page == page && annotation->boundsContain(pt)) {
            return annotation;
        }
    }
    return nullptr;
}

QPointF handleAnchor(const QRectF& bounds, ResizeHandle handle)
{
    const qreal x = bounds.x();
    const qreal y = bounds.y();
    const qreal w = bounds.width();
    const qreal h = bounds.height();

    switch (handle) {
        case ResizeHandle::NW: return QPointF(x - HANDLE_OFFSET, y - HANDLE_OFFSET);
        case ResizeHandle::NE: return QPointF(x + w, y - HANDLE_OFFSET);
        case ResizeHandle::SW: return QPointF(x - HANDLE_OFFSET, y + h);
        case ResizeHandle::SE: return QPointF(x + w, y + h);
        case ResizeHandle::None: break;
    }
    return bounds.topLeft();
}

ResizeHandle resizeHandleAt(const QRectF& bounds, const QPointF& pt)
{
    static const ResizeHandle order[] = {
        ResizeHandle::NW, ResizeHandle::NE, ResizeHandle::SW, ResizeHandle::SE
    };
    for (ResizeHandle handle : order) {
        const QPointF anchor = handleAnchor(bounds, handle);
        if (qAbs(pt.x() - anchor.x()) < HANDLE_TOLERANCE
            && qAbs(pt.y() - anchor.y()) < HANDLE_TOLERANCE) {
            return handle;
        }
    }
    return ResizeHandle::None;
}

QRectF resizedBounds(const QRectF& bounds, ResizeHandle handle, const QPointF& pt, qreal minSize)
{
    qreal x = bounds.x();
    qreal y = bounds.y();
    qreal w = bounds.width();
    qreal h = bounds.height();
    const qreal right = x + w;
    const qreal bottom = y + h;

    const bool movesLeft = handle == ResizeHandle::NW || handle == ResizeHandle::SW;
    const bool movesTop = handle == ResizeHandle::NW || handle == ResizeHandle::NE;

    if (handle == ResizeHandle::None) {
        return bounds;
    }

    if (movesLeft) {
        w = qMax(minSize, right - pt.x());
        x = qMin(pt.x(), right - minSize);
    } else {
        w = qMax(minSize, pt.x() - x);
    }

    if (movesTop) {
        h = qMax(minSize, bottom - pt.y());
        y = qMin(pt.y(), bottom - minSize);
    } else {
        h = qMax(minSize, pt.y() - y);
    }

    return QRectF(x, y, w, h);
}

Qt::CursorShape cursorFor(ResizeHandle handle, bool insideSelection)
{
    switch (handle) {
        case ResizeHandle::NW:
        case ResizeHandle::SE:
            return Qt::SizeFDiagCursor;
        case ResizeHandle::NE:
        case ResizeHandle::SW:
            return Qt::SizeBDiagCursor;
        case ResizeHandle::None:
            break;
    }
    return insideSelection ? Qt::SizeAllCursor : Qt::ArrowCursor;
}

ClickAction clickActionFor(AnnotationType type)
{
    switch (type) {
        case AnnotationType::Checkbox:
            return ClickAction::ToggleCheckbox;
        case AnnotationType::Radio:
            return ClickAction::SelectRadio;
        case AnnotationType::Text:
        case AnnotationType::Drawing:
        case AnnotationType::Signature:
        case AnnotationType::Rectangle:
        case AnnotationType::Line:
        case AnnotationType::Highlight:
        case AnnotationType::Image:
        case AnnotationType::Circle:
        case AnnotationType::Arrow:
        case AnnotationType::Date:
        case AnnotationType::Stamp:
        case AnnotationType::Strikethrough:
        case AnnotationType::Initials:
        case AnnotationType::SignedStamp:
        case AnnotationType::Watermark:
            return ClickAction::None;
    }
    return ClickAction::None;
}

} // namespace HitTesting
