#pragma once

// ============================================================================
// AnnotationHistory - Linear undo/redo over committed collection snapshots
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// entries[cursor] always equals the live collection. Committing after an
// undo discards the redo tail.
// ============================================================================

#include "../annotations/AnnotationCollection.h"

#include <QVector>

class AnnotationHistory {
public:
    /**
     * @param maxEntries Retention cap; 0 keeps every entry.
     */
    explicit AnnotationHistory(int maxEntries = 0);

    /**
     * @brief Record a new snapshot after the cursor.
     */
    void commit(const AnnotationCollection& snapshot);

    /**
     * @brief Step back one snapshot.
     * @return The snapshot now current, or nullptr at the start.
     */
    const AnnotationCollection* undo();

    /**
     * @brief Step forward one snapshot.
     * @return The snapshot now current, or nullptr at the end.
     */
    const AnnotationCollection* redo();

    bool canUndo() const { return m_cursor > 0; }
    bool canRedo() const { return m_cursor < m_entries.size() - 1; }

    /**
     * @brief Back to a single empty snapshot.
     */
    void reset();

    const AnnotationCollection& current() const { return m_entries.at(m_cursor); }
    int cursor() const { return m_cursor; }
    int entryCount() const { return m_entries.size(); }
    int maxEntries() const { return m_maxEntries; }

private:
    QVector<AnnotationCollection> m_entries;
    int m_cursor = 0;
    int m_maxEntries = 0;
};
