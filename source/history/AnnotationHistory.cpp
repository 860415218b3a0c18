#include "AnnotationHistory.h"

AnnotationHistory::AnnotationHistory(int maxEntries)
    : m_maxEntries(maxEntries > 0 ? maxEntries : 0)
{
    reset();
}

void AnnotationHistory::commit(const AnnotationCollection& snapshot)
{
    // Drop the redo tail
    while (m_entries.size() > m_cursor + 1) {
        m_entries.removeLast();
    }
    m_entries.append(snapshot);
    m_cursor = m_entries.size() - 1;

    if (m_maxEntries > 0) {
        while (m_entries.size() > m_maxEntries) {
            m_entries.removeFirst();
            --m_cursor;
        }
    }
}

const AnnotationCollection* AnnotationHistory::undo()
{
    if (!canUndo()) {
        return nullptr;
    }
    --m_cursor;
    return &m_entries.at(m_cursor);
}

const AnnotationCollection* AnnotationHistory::redo()
{
    if (!canRedo()) {
        return nullptr;
    }
    ++m_cursor;
    return &m_entries.at(m_cursor);
}

void AnnotationHistory::reset()
{
    m_entries.clear();
    m_entries.append(AnnotationCollection());
    m_cursor = 0;
}
