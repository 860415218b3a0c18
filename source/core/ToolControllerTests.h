#ifndef TOOLCONTROLLERTESTS_H
#define TOOLCONTROLLERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "AnnotationToolController.h"
#include "ShortcutManager.h"
#include "../annotations/DrawingAnnotation.h"
#include "../annotations/FormAnnotations.h"
#include "../annotations/RasterAnnotations.h"
#include "../annotations/ShapeAnnotations.h"
#include "../annotations/StampAnnotations.h"
#include "../annotations/TextAnnotations.h"
#include "../render/RasterCache.h"

/**
 * Gesture-level tests for AnnotationToolController.
 * Run with: pdfmarkup --test-controller
 */
class ToolControllerTests : public QObject {
    Q_OBJECT

private:
    static QString pngData() {
        QImage image(4, 4, QImage::Format_ARGB32);
        image.fill(Qt::black);
        return RasterCache::encodeDataUrl(image);
    }

    static void drag(AnnotationToolController& c, const QPointF& from, const QPointF& to) {
        c.pointerPress(from);
        c.pointerMove((from + to) / 2.0);
        c.pointerMove(to);
        c.pointerRelease(to);
    }

    static void click(AnnotationToolController& c, const QPointF& pt) {
        c.pointerPress(pt);
        c.pointerRelease(pt);
    }

private slots:
    void initTestCase() {
        ShortcutManager::instance()->resetAllToDefaults();
    }

    // Rubber-band shapes normalize reversed drags and ignore tiny ones
    void testRectangleRubberBand() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Rectangle);

        drag(c, QPointF(60, 40), QPointF(10, 10));
        QCOMPARE(c.annotations().size(), 1);
        const Annotation* rect = c.annotations().at(0);
        QCOMPARE(rect->type(), AnnotationType::Rectangle);
        QCOMPARE(rect->boundingRect(), QRectF(10, 10, 50, 30));
        QCOMPARE(c.selectedId(), rect->id);
        QCOMPARE(c.history().entryCount(), 2);
        QCOMPARE(c.state(), AnnotationToolController::State::Idle);

        // 5 px is not enough
        drag(c, QPointF(100, 100), QPointF(105, 140));
        QCOMPARE(c.annotations().size(), 1);
        QCOMPARE(c.history().entryCount(), 2);
    }

    void testLineKeepsEndpoints() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Line);

        drag(c, QPointF(10, 10), QPointF(100, 10));
        QCOMPARE(c.annotations().size(), 1);
        const auto* line = static_cast<const LineAnnotation*>(c.annotations().at(0));
        QCOMPARE(line->p1, QPointF(10, 10));
        QCOMPARE(line->p2, QPointF(100, 10));
        QCOMPARE(line->boundingRect(), QRectF(10, 10, 90, 1));

        // A click or a short drag defines nothing
        click(c, QPointF(50, 50));
        drag(c, QPointF(50, 50), QPointF(54, 53));
        c.setActiveTool(ToolType::Arrow);
        click(c, QPointF(50, 50));
        QCOMPARE(c.annotations().size(), 1);
        QCOMPARE(c.history().entryCount(), 2);

        // Vertical arrow keeps a 1 px width
        drag(c, QPointF(30, 80), QPointF(30, 20));
        QCOMPARE(c.annotations().size(), 2);
        const auto* arrow = static_cast<const ArrowAnnotation*>(c.annotations().at(1));
        QCOMPARE(arrow->p1, QPointF(30, 80));
        QCOMPARE(arrow->boundingRect(), QRectF(30, 20, 1, 60));
    }

    void testStrikethroughMinimumSize() {
        AnnotationToolController c;
        c.settings().redactMode = true;
        c.setActiveTool(ToolType::Strikethrough);

        drag(c, QPointF(10, 10), QPointF(80, 12));
        QCOMPARE(c.annotations().size(), 1);
        const auto* strike = static_cast<const StrikethroughAnnotation*>(c.annotations().at(0));
        QCOMPARE(strike->boundingRect(), QRectF(10, 10, 70, 10));
        QVERIFY(strike->isRedact);
    }

    void testFreehandAndEraser() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Draw);

        // A single point is not a stroke
        click(c, QPointF(5, 5));
        QVERIFY(c.annotations().isEmpty());

        c.pointerPress(QPointF(10, 10));
        c.pointerMove(QPointF(20, 20));
        c.pointerRelease(QPointF(30, 30));
        QCOMPARE(c.annotations().size(), 1);
        const auto* drawing = static_cast<const DrawingAnnotation*>(c.annotations().at(0));
        QCOMPARE(drawing->paths.size(), 1);
        QCOMPARE(drawing->paths.first().points.size(), 2);
        QCOMPARE(drawing->boundingRect(), QRectF(10, 10, 10, 10));

        // Same stroke on page 2 survives erasing page 1
        c.setCurrentPage(2);
        c.pointerPress(QPointF(10, 10));
        c.pointerMove(QPointF(20, 20));
        c.pointerRelease(QPointF(20, 20));
        c.setCurrentPage(1);
        QCOMPARE(c.annotations().size(), 2);

        // Radius is strokeWidth * 3 = 6
        c.setActiveTool(ToolType::Eraser);
        click(c, QPointF(40, 40));
        QCOMPARE(c.annotations().size(), 2);

        const int entries = c.history().entryCount();
        click(c, QPointF(22, 22));
        QCOMPARE(c.annotations().size(), 1);
        QCOMPARE(c.annotations().at(0)->page, 2);
        QCOMPARE(c.history().entryCount(), entries + 1);
    }

    void testDragCommitsOnlyOnChange() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Rectangle);
        drag(c, QPointF(10, 10), QPointF(60, 40));
        c.setActiveTool(ToolType::Select);
        const QString id = c.selectedId();
        QCOMPARE(c.history().entryCount(), 2);

        c.pointerPress(QPointF(30, 25));
        QCOMPARE(c.state(), AnnotationToolController::State::DraggingAnnotation);
        c.pointerMove(QPointF(40, 35));
        c.pointerRelease(QPointF(40, 35));
        QCOMPARE(c.annotations().find(id)->boundingRect(), QRectF(20, 20, 50, 30));
        QCOMPARE(c.history().entryCount(), 3);

        // Press and release in place adds nothing
        click(c, QPointF(30, 30));
        QCOMPARE(c.history().entryCount(), 3);
        QCOMPARE(c.selectedId(), id);

        // Empty space clears the selection
        click(c, QPointF(300, 300));
        QVERIFY(c.selectedId().isEmpty());
    }

    void testResizeFromHandle() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Rectangle);
        drag(c, QPointF(10, 10), QPointF(60, 40));
        c.setActiveTool(ToolType::Select);
        const QString id = c.selectedId();

        // SE handle anchor sits on the bottom-right corner
        c.pointerPress(QPointF(60, 40));
        QCOMPARE(c.state(), AnnotationToolController::State::ResizingAnnotation);
        c.pointerMove(QPointF(100, 80));
        c.pointerRelease(QPointF(100, 80));
        QCOMPARE(c.annotations().find(id)->boundingRect(), QRectF(10, 10, 90, 70));

        // Never below 20x20
        c.pointerPress(QPointF(100, 80));
        c.pointerMove(QPointF(0, 0));
        c.pointerRelease(QPointF(0, 0));
        QCOMPARE(c.annotations().find(id)->boundingRect(), QRectF(10, 10, 20, 20));
    }

    void testHoverCursor() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Rectangle);
        drag(c, QPointF(10, 10), QPointF(60, 40));
        c.setActiveTool(ToolType::Select);

        c.pointerMove(QPointF(6, 6));
        QCOMPARE(c.hoverCursor(), Qt::SizeFDiagCursor);
        c.pointerMove(QPointF(30, 25));
        QCOMPARE(c.hoverCursor(), Qt::SizeAllCursor);
        c.pointerMove(QPointF(300, 300));
        QCOMPARE(c.hoverCursor(), Qt::ArrowCursor);
    }

    void testCheckboxToggle() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Checkbox);
        click(c, QPointF(100, 100));
        QCOMPARE(c.activeTool(), ToolType::Checkbox);
        QCOMPARE(c.annotations().size(), 1);
        const QString id = c.annotations().at(0)->id;
        QCOMPARE(c.annotations().at(0)->boundingRect(), QRectF(100, 100, 24, 24));

        c.setActiveTool(ToolType::Select);
        click(c, QPointF(110, 110));
        QVERIFY(static_cast<const CheckboxAnnotation*>(c.annotations().find(id))->checked);
        QCOMPARE(c.history().entryCount(), 3);

        QVERIFY(c.undo());
        QVERIFY(!static_cast<const CheckboxAnnotation*>(c.annotations().find(id))->checked);
    }

    void testRadioGroupAcrossPages() {
        AnnotationToolController c;
        c.settings().radioGroup = 4;
        c.setActiveTool(ToolType::Radio);
        click(c, QPointF(0, 0));
        const QString first = c.annotations().at(0)->id;
        c.setCurrentPage(2);
        click(c, QPointF(0, 0));
        const QString second = c.annotations().at(1)->id;
        QCOMPARE(static_cast<const RadioAnnotation*>(c.annotations().find(second))->groupId, QString("group-4"));

        // (8, 8) is inside the 20x20 box but clear of every handle
        c.setActiveTool(ToolType::Select);
        click(c, QPointF(8, 8));
        c.setCurrentPage(1);
        click(c, QPointF(8, 8));

        QVERIFY(static_cast<const RadioAnnotation*>(c.annotations().find(first))->checked);
        QVERIFY(!static_cast<const RadioAnnotation*>(c.annotations().find(second))->checked);

        // Clicking the checked radio again changes nothing
        const int entries = c.history().entryCount();
        click(c, QPointF(8, 8));
        QCOMPARE(c.history().entryCount(), entries);
        QVERIFY(static_cast<const RadioAnnotation*>(c.annotations().find(first))->checked);
    }

    void testTextEditing() {
        AnnotationToolController c;
        QSignalSpy started(&c, &AnnotationToolController::textEditingStarted);
        QSignalSpy finished(&c, &AnnotationToolController::textEditingFinished);
        c.setActiveTool(ToolType::Text);

        c.pointerPress(QPointF(50, 50));
        QCOMPARE(c.state(), AnnotationToolController::State::EditingText);
        QCOMPARE(started.count(), 1);
        QCOMPARE(c.annotations().size(), 1);
        QCOMPARE(c.annotations().at(0)->boundingRect(), QRectF(50, 50, 200, 21));
        QCOMPARE(c.history().entryCount(), 1);

        // Keys go to the editor, not to shortcuts
        QVERIFY(!c.handleKeyPress(Qt::Key_V, Qt::NoModifier));

        c.updateEditingText("Hello");
        c.finishTextEditing();
        QCOMPARE(finished.count(), 1);
        QCOMPARE(c.history().entryCount(), 2);
        const auto* text = static_cast<const TextAnnotation*>(c.annotations().at(0));
        QCOMPARE(text->text, QString("Hello"));
        QCOMPARE(text->size, TextAnnotation::estimatedSize("Hello", 14));

        // Blank text is removed and leaves no history entry
        c.pointerPress(QPointF(50, 200));
        c.updateEditingText("   ");
        c.finishTextEditing();
        QCOMPARE(c.annotations().size(), 1);
        QCOMPARE(c.history().entryCount(), 2);
        QVERIFY(c.undo());
        QVERIFY(c.annotations().isEmpty());
        QCOMPARE(c.state(), AnnotationToolController::State::Idle);
    }

    void testDatePlacement() {
        AnnotationToolController c;
        QSignalSpy requested(&c, &AnnotationToolController::modalInputRequested);
        c.setActiveTool(ToolType::Date);

        c.pointerPress(QPointF(40, 40));
        QCOMPARE(requested.count(), 1);
        QCOMPARE(c.state(), AnnotationToolController::State::AwaitingModalInput);
        QCOMPARE(c.pendingModalPosition(), QPointF(40, 40));

        QVERIFY(!c.placeSignedStamp(pngData(), QDate(2024, 3, 5)));
        QVERIFY(c.placeDate(QDate(2024, 3, 5)));
        QCOMPARE(c.state(), AnnotationToolController::State::Idle);

        const auto* date = static_cast<const DateAnnotation*>(c.annotations().at(0));
        QCOMPARE(date->text, QString("03/05/2024"));
        QVERIFY(qAbs(date->size.width() - 84.0) < 1e-6);
        QVERIFY(qAbs(date->size.height() - 16.8) < 1e-6);
        QCOMPARE(c.activeTool(), ToolType::Date);

        // Nothing pending any more
        QVERIFY(!c.placeDate(QDate(2024, 3, 6)));
    }

    void testModalCancelledByPageChange() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Date);
        c.pointerPress(QPointF(40, 40));
        c.setCurrentPage(3);
        QCOMPARE(c.state(), AnnotationToolController::State::Idle);
        QVERIFY(!c.placeDate(QDate(2024, 3, 5)));
        QVERIFY(c.annotations().isEmpty());
    }

    void testSignedStampNeedsSignature() {
        AnnotationToolController c;
        QSignalSpy failed(&c, &AnnotationToolController::validationFailed);
        c.setActiveTool(ToolType::SignedStamp);
        c.pointerPress(QPointF(20, 30));

        QVERIFY(!c.placeSignedStamp(QString(), QDate(2024, 3, 5)));
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.takeFirst().at(0).toString(), QString("Please draw or upload a signature"));
        QCOMPARE(c.state(), AnnotationToolController::State::AwaitingModalInput);

        QVERIFY(c.placeSignedStamp(pngData(), QDate(2024, 3, 5)));
        QCOMPARE(c.activeTool(), ToolType::Select);
        const auto* stamp = static_cast<const SignedStampAnnotation*>(c.annotations().at(0));
        QCOMPARE(stamp->boundingRect(), QRectF(20, 30, 150, 150));
        QCOMPARE(stamp->dateText, QString("Mar 05, 2024"));
    }

    void testWatermarkCenteredOnClick() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Watermark);
        c.pointerPress(QPointF(300, 300));
        QVERIFY(c.placeWatermark());
        QCOMPARE(c.activeTool(), ToolType::Select);

        // "CONFIDENTIAL" at 48 px: 12 * 48 * 0.6 wide, 48 + 20 tall
        const Annotation* watermark = c.annotations().at(0);
        QVERIFY(qAbs(watermark->size.width() - 345.6) < 1e-6);
        QVERIFY(qAbs(watermark->size.height() - 68.0) < 1e-6);
        QVERIFY(qAbs(watermark->center().x() - 300.0) < 1e-6);
        QVERIFY(qAbs(watermark->center().y() - 300.0) < 1e-6);
    }

    void testSignatureCapture() {
        AnnotationToolController c;
        QSignalSpy capture(&c, &AnnotationToolController::captureRequested);
        c.setActiveTool(ToolType::Signature);

        click(c, QPointF(10, 10));
        QCOMPARE(capture.count(), 1);
        QVERIFY(c.annotations().isEmpty());

        c.setSignatureData(pngData());
        click(c, QPointF(10, 10));
        QCOMPARE(c.annotations().size(), 1);
        QCOMPARE(c.annotations().at(0)->boundingRect(), QRectF(10, 10, 200, 80));
        QCOMPARE(c.activeTool(), ToolType::Select);
    }

    void testImagePlacement() {
        AnnotationToolController c;
        QSignalSpy failed(&c, &AnnotationToolController::validationFailed);

        QVERIFY(!c.placeImage(pngData(), QSizeF()));
        QCOMPARE(failed.count(), 1);

        QVERIFY(c.placeImage(pngData(), QSizeF(400, 200)));
        QCOMPARE(c.annotations().at(0)->boundingRect(), QRectF(100, 100, 200, 100));
        QCOMPARE(c.activeTool(), ToolType::Select);

        // Staged images are placed by the image tool and then consumed
        c.stageImage(pngData(), QSizeF(100, 300));
        c.setActiveTool(ToolType::Image);
        click(c, QPointF(5, 5));
        QCOMPARE(c.annotations().size(), 2);
        QCOMPARE(c.annotations().at(1)->boundingRect(), QRectF(5, 5, 200, 600));
        QVERIFY(c.settings().stagedImageData.isEmpty());
    }

    void testUndoRedoAndDelete() {
        AnnotationToolController c;
        c.setActiveTool(ToolType::Checkbox);
        click(c, QPointF(10, 10));
        QVERIFY(!c.selectedId().isEmpty());

        QVERIFY(c.undo());
        QVERIFY(c.annotations().isEmpty());
        QVERIFY(c.selectedId().isEmpty());
        QVERIFY(!c.undo());

        QVERIFY(c.redo());
        QCOMPARE(c.annotations().size(), 1);
        QVERIFY(c.selectedId().isEmpty());
        QVERIFY(!c.redo());

        QVERIFY(!c.deleteSelected());
        c.setActiveTool(ToolType::Select);
        click(c, QPointF(15, 15));
        QVERIFY(c.deleteSelected());
        QVERIFY(c.annotations().isEmpty());
        QVERIFY(c.canUndo());
    }

    void testRevertAll() {
        AnnotationToolController c;
        QSignalSpy status(&c, &AnnotationToolController::statusMessage);
        c.setActiveTool(ToolType::Checkbox);
        click(c, QPointF(10, 10));
        click(c, QPointF(50, 10));

        c.revertAll();
        QVERIFY(c.annotations().isEmpty());
        QCOMPARE(c.history().entryCount(), 1);
        QVERIFY(!c.canUndo());
        QVERIFY(!status.isEmpty());
        QCOMPARE(status.last().at(0).toString(), QString("All changes reverted"));
    }

    void testKeyboardShortcuts() {
        AnnotationToolController c;

        QVERIFY(c.handleKeyPress(Qt::Key_R, Qt::NoModifier));
        QCOMPARE(c.activeTool(), ToolType::Rectangle);
        QVERIFY(c.handleKeyPress(Qt::Key_8, Qt::NoModifier));
        QCOMPARE(c.activeTool(), ToolType::Arrow);
        QVERIFY(c.handleKeyPress(Qt::Key_Escape, Qt::NoModifier));
        QCOMPARE(c.activeTool(), ToolType::Select);
        QVERIFY(!c.handleKeyPress(Qt::Key_Q, Qt::NoModifier));

        c.setActiveTool(ToolType::Checkbox);
        click(c, QPointF(10, 10));
        QCOMPARE(c.annotations().size(), 1);

        // Cmd+Z behaves like Ctrl+Z
        QVERIFY(c.handleKeyPress(Qt::Key_Z, Qt::MetaModifier));
        QVERIFY(c.annotations().isEmpty());
        QVERIFY(c.handleKeyPress(Qt::Key_Y, Qt::ControlModifier));
        QCOMPARE(c.annotations().size(), 1);

        c.setActiveTool(ToolType::Select);
        click(c, QPointF(15, 15));
        QVERIFY(c.handleKeyPress(Qt::Key_Delete, Qt::NoModifier));
        QVERIFY(c.annotations().isEmpty());
    }

    void testPlacementRects() {
        ToolSettings s;
        const QPointF at(10, 20);
        QCOMPARE(AnnotationToolController::placementRect(ToolType::Text, at, s), QRectF(10, 20, 200, 21));
        QCOMPARE(AnnotationToolController::placementRect(ToolType::Radio, at, s), QRectF(10, 20, 20, 20));
        QCOMPARE(AnnotationToolController::placementRect(ToolType::Initials, at, s), QRectF(10, 20, 60, 30));
        QCOMPARE(AnnotationToolController::placementRect(ToolType::Stamp, at, s), QRectF(10, 20, 150, 40));

        s.stampType = "custom";
        s.stampCustomText = "PAID IN FULL TODAY";
        QCOMPARE(AnnotationToolController::placementRect(ToolType::Stamp, at, s), QRectF(10, 20, 216, 40));
        s.stampShape = StampShape::Circle;
        QCOMPARE(AnnotationToolController::placementRect(ToolType::Stamp, at, s), QRectF(10, 20, 100, 100));
    }
};

/**
 * Run controller tests.
 * @return 0 if all tests pass, non-zero otherwise
 */
inline int runToolControllerTests() {
    ToolControllerTests tests;
    return QTest::qExec(&tests);
}

#endif // TOOLCONTROLLERTESTS_H
