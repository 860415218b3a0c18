#pragma once

// ============================================================================
// HistoryTests - Unit tests for AnnotationHistory
// ============================================================================
// Part of the PdfMarkup annotation engine
// Run with: pdfmarkup --test-history
// ============================================================================

#include "AnnotationHistory.h"
#include "../annotations/FormAnnotations.h"

#include <QDebug>

namespace HistoryTests {

/**
 * @brief Collection holding `count` checkboxes with ids cb-0 .. cb-(count-1).
 */
inline AnnotationCollection checkboxes(int count)
{
    AnnotationCollection collection;
    for (int i = 0; i < count; ++i) {
        auto box = std::make_unique<CheckboxAnnotation>();
        box->id = QStringLiteral("cb-%1").arg(i);
        box->position = QPointF(i * 30, 0);
        box->size = QSizeF(24, 24);
        collection = collection.withAdded(std::move(box));
    }
    return collection;
}

inline bool testInitialState()
{
    qDebug() << "=== Test: Initial State ===";
    bool success = true;

    AnnotationHistory history;
    if (history.entryCount() != 1 || history.cursor() != 0 || !history.current().isEmpty()) {
        qDebug() << "FAIL: history should start with one empty entry";
        success = false;
    }
    if (history.canUndo() || history.canRedo()) {
        qDebug() << "FAIL: nothing to undo or redo initially";
        success = false;
    }
    if (history.undo() != nullptr || history.redo() != nullptr) {
        qDebug() << "FAIL: undo/redo at the ends should return nullptr";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Initial state";
    }
    return success;
}

inline bool testUndoRedo()
{
    qDebug() << "=== Test: Undo/Redo ===";
    bool success = true;

    AnnotationHistory history;
    history.commit(checkboxes(1));
    history.commit(checkboxes(2));

    const AnnotationCollection* snapshot = history.undo();
    if (!snapshot || snapshot->size() != 1) {
        qDebug() << "FAIL: first undo should restore one annotation";
        success = false;
    }
    snapshot = history.undo();
    if (!snapshot || !snapshot->isEmpty()) {
        qDebug() << "FAIL: second undo should restore the empty collection";
        success = false;
    }
    if (history.canUndo()) {
        qDebug() << "FAIL: cursor should be at the start";
        success = false;
    }

    snapshot = history.redo();
    if (!snapshot || snapshot->size() != 1 || !history.canRedo()) {
        qDebug() << "FAIL: redo should step forward one entry";
        success = false;
    }
    if (history.current() != checkboxes(1)) {
        qDebug() << "FAIL: current() should match the redone snapshot";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Undo/redo";
    }
    return success;
}

/**
 * @brief A commit after undo drops the redo tail.
 */
inline bool testCommitTruncatesRedo()
{
    qDebug() << "=== Test: Commit Truncates Redo ===";
    bool success = true;

    AnnotationHistory history;
    history.commit(checkboxes(1));
    history.commit(checkboxes(2));
    history.commit(checkboxes(3));
    history.undo();
    history.undo();

    history.commit(checkboxes(1).withToggledCheckbox("cb-0"));
    if (history.canRedo() || history.entryCount() != 3 || history.cursor() != 2) {
        qDebug() << "FAIL: expected 3 entries with the cursor on the last, got"
                 << history.entryCount() << "cursor" << history.cursor();
        success = false;
    }

    const auto* box = static_cast<const CheckboxAnnotation*>(history.current().find("cb-0"));
    if (!box || !box->checked) {
        qDebug() << "FAIL: current entry should be the new commit";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Commit truncates redo";
    }
    return success;
}

inline bool testRetentionCap()
{
    qDebug() << "=== Test: Retention Cap ===";
    bool success = true;

    AnnotationHistory history(3);
    for (int i = 1; i <= 5; ++i) {
        history.commit(checkboxes(i));
    }

    if (history.entryCount() != 3 || history.cursor() != 2) {
        qDebug() << "FAIL: cap of 3 should keep 3 entries, got" << history.entryCount();
        success = false;
    }
    history.undo();
    const AnnotationCollection* oldest = history.undo();
    if (!oldest || oldest->size() != 3 || history.canUndo()) {
        qDebug() << "FAIL: oldest retained entry should hold 3 annotations";
        success = false;
    }

    history.reset();
    if (history.entryCount() != 1 || !history.current().isEmpty() || history.maxEntries() != 3) {
        qDebug() << "FAIL: reset should leave one empty entry and keep the cap";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Retention cap";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running History Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testInitialState();
    allPass &= testUndoRedo();
    allPass &= testCommitTruncatesRedo();
    allPass &= testRetentionCap();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace HistoryTests
