#pragma once

// ============================================================================
// HitTestingTests - Unit tests for picking and resize handles
// ============================================================================
// Part of the PdfMarkup annotation engine
// Run with: pdfmarkup --test-hittest
// ============================================================================

#include "HitTesting.h"
#include "../annotations/FormAnnotations.h"
#include "../annotations/ShapeAnnotations.h"

#include <QDebug>

namespace HitTestingTests {

inline std::unique_ptr<Annotation> rectangle(const QString& id, int page, const QRectF& bounds)
{
    auto rect = std::make_unique<RectangleAnnotation>();
    rect->id = id;
    rect->page = page;
    rect->setBoundingRect(bounds);
    return rect;
}

/**
 * @brief Later annotations win; other pages are ignored.
 */
inline bool testTopmostHit()
{
    qDebug() << "=== Test: Topmost Hit ===";
    bool success = true;

    const AnnotationCollection collection = AnnotationCollection()
        .withAdded(rectangle("bottom", 1, QRectF(0, 0, 100, 100)))
        .withAdded(rectangle("top", 1, QRectF(50, 50, 100, 100)))
        .withAdded(rectangle("elsewhere", 2, QRectF(0, 0, 300, 300)));

    const Annotation* hit = HitTesting::hitTest(collection, 1, QPointF(75, 75));
    if (!hit || hit->id != QLatin1String("top")) {
        qDebug() << "FAIL: overlap should pick the later annotation";
        success = false;
    }

    hit = HitTesting::hitTest(collection, 1, QPointF(10, 10));
    if (!hit || hit->id != QLatin1String("bottom")) {
        qDebug() << "FAIL: (10,10) should hit bottom";
        success = false;
    }

    // Edges are inclusive
    hit = HitTesting::hitTest(collection, 1, QPointF(150, 150));
    if (!hit || hit->id != QLatin1String("top")) {
        qDebug() << "FAIL: bottom-right corner should be inside";
        success = false;
    }

    if (HitTesting::hitTest(collection, 1, QPointF(200, 10)) != nullptr) {
        qDebug() << "FAIL: empty area should hit nothing";
        success = false;
    }

    hit = HitTesting::hitTest(collection, 2, QPointF(75, 75));
    if (!hit || hit->id != QLatin1String("elsewhere")) {
        qDebug() << "FAIL: page 2 lookup should only see page 2";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Topmost hit";
    }
    return success;
}

inline bool testHandleDetection()
{
    qDebug() << "=== Test: Handle Detection ===";
    bool success = true;

    const QRectF bounds(100, 100, 50, 40);

    if (HitTesting::handleAnchor(bounds, ResizeHandle::NW) != QPointF(96, 96)
        || HitTesting::handleAnchor(bounds, ResizeHandle::NE) != QPointF(150, 96)
        || HitTesting::handleAnchor(bounds, ResizeHandle::SW) != QPointF(96, 140)
        || HitTesting::handleAnchor(bounds, ResizeHandle::SE) != QPointF(150, 140)) {
        qDebug() << "FAIL: handle anchors misplaced";
        success = false;
    }

    if (HitTesting::resizeHandleAt(bounds, QPointF(150, 140)) != ResizeHandle::SE) {
        qDebug() << "FAIL: SE anchor should hit SE";
        success = false;
    }
    if (HitTesting::resizeHandleAt(bounds, QPointF(107, 107)) != ResizeHandle::NW) {
        qDebug() << "FAIL: (107,107) is 11 px from NW and should hit it";
        success = false;
    }
    // Tolerance is strict
    if (HitTesting::resizeHandleAt(bounds, QPointF(108, 96)) != ResizeHandle::None) {
        qDebug() << "FAIL: 12 px away should miss";
        success = false;
    }
    if (HitTesting::resizeHandleAt(bounds, QPointF(125, 120)) != ResizeHandle::None) {
        qDebug() << "FAIL: center should not hit a handle";
        success = false;
    }

    // Tiny boxes overlap every handle; NW is checked first
    if (HitTesting::resizeHandleAt(QRectF(0, 0, 4, 4), QPointF(2, 2)) != ResizeHandle::NW) {
        qDebug() << "FAIL: overlapping handles should resolve to NW";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Handle detection";
    }
    return success;
}

inline bool testResizeGeometry()
{
    qDebug() << "=== Test: Resize Geometry ===";
    bool success = true;

    const QRectF bounds(100, 100, 50, 40);

    QRectF r = HitTesting::resizedBounds(bounds, ResizeHandle::SE, QPointF(200, 180));
    if (r != QRectF(100, 100, 100, 80)) {
        qDebug() << "FAIL: SE drag gave" << r;
        success = false;
    }

    r = HitTesting::resizedBounds(bounds, ResizeHandle::NW, QPointF(80, 90));
    if (r != QRectF(80, 90, 70, 50)) {
        qDebug() << "FAIL: NW drag gave" << r;
        success = false;
    }

    // Dragging past the opposite edge clamps to the minimum size
    r = HitTesting::resizedBounds(bounds, ResizeHandle::NW, QPointF(200, 200));
    if (r != QRectF(130, 120, 20, 20)) {
        qDebug() << "FAIL: NW clamp gave" << r;
        success = false;
    }

    r = HitTesting::resizedBounds(bounds, ResizeHandle::NE, QPointF(90, 60));
    if (r != QRectF(100, 60, 20, 80)) {
        qDebug() << "FAIL: NE drag gave" << r;
        success = false;
    }

    r = HitTesting::resizedBounds(bounds, ResizeHandle::SW, QPointF(120, 150));
    if (r != QRectF(120, 100, 30, 50)) {
        qDebug() << "FAIL: SW drag gave" << r;
        success = false;
    }

    if (HitTesting::resizedBounds(bounds, ResizeHandle::None, QPointF(0, 0)) != bounds) {
        qDebug() << "FAIL: no handle should leave bounds alone";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Resize geometry";
    }
    return success;
}

inline bool testCursorsAndClickActions()
{
    qDebug() << "=== Test: Cursors and Click Actions ===";
    bool success = true;

    if (HitTesting::cursorFor(ResizeHandle::NW, false) != Qt::SizeFDiagCursor
        || HitTesting::cursorFor(ResizeHandle::SE, true) != Qt::SizeFDiagCursor
        || HitTesting::cursorFor(ResizeHandle::NE, false) != Qt::SizeBDiagCursor
        || HitTesting::cursorFor(ResizeHandle::SW, true) != Qt::SizeBDiagCursor) {
        qDebug() << "FAIL: handle cursors";
        success = false;
    }
    if (HitTesting::cursorFor(ResizeHandle::None, true) != Qt::SizeAllCursor
        || HitTesting::cursorFor(ResizeHandle::None, false) != Qt::ArrowCursor) {
        qDebug() << "FAIL: move/default cursors";
        success = false;
    }

    if (HitTesting::clickActionFor(AnnotationType::Checkbox) != ClickAction::ToggleCheckbox
        || HitTesting::clickActionFor(AnnotationType::Radio) != ClickAction::SelectRadio
        || HitTesting::clickActionFor(AnnotationType::Text) != ClickAction::None
        || HitTesting::clickActionFor(AnnotationType::Watermark) != ClickAction::None) {
        qDebug() << "FAIL: click actions";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Cursors and click actions";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Hit Testing Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testTopmostHit();
    allPass &= testHandleDetection();
    allPass &= testResizeGeometry();
    allPass &= testCursorsAndClickActions();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace HitTestingTests
