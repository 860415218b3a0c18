#pragma once

// ============================================================================
// ShortcutTests - Unit tests for ShortcutManager
// ============================================================================
// Part of the PdfMarkup annotation engine
// Run with: pdfmarkup --test-shortcuts
//
// Overrides made here are reset before returning and never saved.
// ============================================================================

#include "ShortcutManager.h"

#include <QDebug>
#include <QKeySequence>

namespace ShortcutTests {

inline bool testDefaultBindings()
{
    qDebug() << "=== Test: Default Bindings ===";
    bool success = true;

    ShortcutManager* sm = ShortcutManager::instance();
    sm->resetAllToDefaults();

    const struct {
        const char* sequence;
        const char* action;
    } bindings[] = {
        { "Ctrl+Z", "edit.undo" },
        { "Ctrl+Y", "edit.redo" },
        { "Delete", "edit.delete" },
        { "Backspace", "edit.delete_alt" },
        { "Escape", "edit.deselect" },
        { "V", "tool.select" },
        { "1", "tool.select_alt" },
        { "T", "tool.text" },
        { "D", "tool.draw" },
        { "S", "tool.signature" },
        { "H", "tool.highlight" },
        { "R", "tool.rectangle" },
        { "C", "tool.circle" },
        { "8", "tool.arrow_alt" },
        { "Ctrl+=", "zoom.in" },
        { "Ctrl+-", "zoom.out" },
        { "Ctrl+0", "zoom.reset" },
        { "Ctrl+Shift+W", "zoom.fit_width" },
        { "PgUp", "navigation.prev_page" },
        { "PgDown", "navigation.next_page" },
        { "Ctrl+O", "file.open" },
        { "Ctrl+S", "file.export" },
    };

    for (const auto& b : bindings) {
        const QString action = sm->actionForKeySequence(QKeySequence(QString::fromLatin1(b.sequence)));
        if (action != QLatin1String(b.action)) {
            qDebug() << "FAIL:" << b.sequence << "should map to" << b.action << "got" << action;
            success = false;
        }
    }

    if (sm->actionForKeySequence(QKeySequence(Qt::CTRL | Qt::Key_Z)) != QLatin1String("edit.undo")) {
        qDebug() << "FAIL: key combination lookup for Ctrl+Z";
        success = false;
    }
    if (!sm->actionForKeySequence(QKeySequence()).isEmpty()
        || !sm->actionForKeySequence(QKeySequence(QStringLiteral("Ctrl+Alt+Q"))).isEmpty()) {
        qDebug() << "FAIL: unbound sequences should map to nothing";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Default bindings";
    }
    return success;
}

inline bool testUserOverrides()
{
    qDebug() << "=== Test: User Overrides ===";
    bool success = true;

    ShortcutManager* sm = ShortcutManager::instance();
    sm->resetAllToDefaults();

    // Shifted digits are stored as the digit
    sm->setUserShortcut("tool.text", "Ctrl+Shift+@");
    if (sm->shortcutForAction("tool.text") != QLatin1String("Ctrl+Shift+2") || !sm->isUserOverridden("tool.text")) {
        qDebug() << "FAIL: override should normalize to Ctrl+Shift+2, got" << sm->shortcutForAction("tool.text");
        success = false;
    }
    if (sm->actionForKeySequence(QKeySequence(QStringLiteral("T"))) == QLatin1String("tool.text")) {
        qDebug() << "FAIL: the old default should no longer trigger tool.text";
        success = false;
    }

    // Setting the default again drops the override
    sm->setUserShortcut("tool.text", "T");
    if (sm->isUserOverridden("tool.text") || sm->shortcutForAction("tool.text") != QLatin1String("T")) {
        qDebug() << "FAIL: default value should clear the override";
        success = false;
    }

    sm->setUserShortcut("no.such.action", "Ctrl+K");
    if (sm->hasAction("no.such.action")) {
        qDebug() << "FAIL: overriding an unknown action should not register it";
        success = false;
    }

    sm->resetAllToDefaults();

    if (success) {
        qDebug() << "PASS: User overrides";
    }
    return success;
}

/**
 * @brief Duplicate bindings are reported and resolve by sorted action id.
 */
inline bool testConflicts()
{
    qDebug() << "=== Test: Conflicts ===";
    bool success = true;

    ShortcutManager* sm = ShortcutManager::instance();
    sm->resetAllToDefaults();

    sm->setUserShortcut("tool.text", "V");
    const QStringList conflicts = sm->findConflicts("V");
    if (conflicts.size() != 2 || !conflicts.contains("tool.select") || !conflicts.contains("tool.text")) {
        qDebug() << "FAIL: V should conflict between select and text, got" << conflicts;
        success = false;
    }
    if (sm->findConflicts("V", "tool.text") != QStringList{ "tool.select" }) {
        qDebug() << "FAIL: excluded action should not be reported";
        success = false;
    }
    if (sm->actionForKeySequence(QKeySequence(QStringLiteral("V"))) != QLatin1String("tool.select")) {
        qDebug() << "FAIL: conflict should resolve to the first id in sorted order";
        success = false;
    }

    sm->resetAllToDefaults();
    if (sm->isUserOverridden("tool.text")) {
        qDebug() << "FAIL: reset should clear every override";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Conflicts";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Shortcut Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testDefaultBindings();
    allPass &= testUserOverrides();
    allPass &= testConflicts();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ShortcutTests
