#pragma once

// ============================================================================
// AnnotationCollection - Ordered set of annotations for one editing session
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Order is paint order (later entries paint on top and win hit tests).
// Mutators never change the receiver; each returns a new collection so
// that a committed snapshot can be stored in AnnotationHistory and shared
// safely with the renderer.
// ============================================================================

#include "Annotation.h"

#include <QByteArray>
#include <QJsonArray>
#include <QVector>

#include <functional>
#include <memory>
#include <vector>

class AnnotationCollection {
public:
    AnnotationCollection() = default;
    AnnotationCollection(const AnnotationCollection& other);
    AnnotationCollection& operator=(const AnnotationCollection& other);
    AnnotationCollection(AnnotationCollection&&) noexcept = default;
    AnnotationCollection& operator=(AnnotationCollection&&) noexcept = default;

    // ===== Queries =====

    int size() const { return static_cast<int>(m_items.size()); }
    bool isEmpty() const { return m_items.empty(); }
    const Annotation* at(int index) const { return m_items.at(static_cast<size_t>(index)).get(); }

    /**
     * @brief Find by id.
     * @return nullptr if no annotation has that id.
     */
    const Annotation* find(const QString& id) const;

    /**
     * @brief Index of the annotation with the given id, or -1.
     */
    int indexOf(const QString& id) const;

    /**
     * @brief Annotations on a page, in paint order.
     */
    QVector<const Annotation*> onPage(int page) const;

    /**
     * @brief Distinct pages that carry at least one annotation, ascending.
     */
    QVector<int> pages() const;

    // ===== Pure Updates =====

    /**
     * @brief Append an annotation.
     *
     * Adding an id that is already present returns an unchanged copy.
     */
    AnnotationCollection withAdded(std::unique_ptr<Annotation> annotation) const;

    /**
     * @brief Apply a JSON patch to one annotation (id/type/page ignored).
     *
     * Unknown id returns an unchanged copy.
     */
    AnnotationCollection withUpdated(const QString& id, const QJsonObject& patch) const;

    /**
     * @brief Apply an arbitrary edit to a copy of one annotation.
     */
    AnnotationCollection withModified(const QString& id,
                                      const std::function<void(Annotation&)>& edit) const;

    /**
     * @brief Move/resize one annotation (interior geometry follows).
     */
    AnnotationCollection withBounds(const QString& id, const QRectF& bounds) const;

    AnnotationCollection withRemoved(const QString& id) const;

    AnnotationCollection withRemovedIf(const std::function<bool(const Annotation&)>& predicate) const;

    /**
     * @brief Flip a checkbox.
     */
    AnnotationCollection withToggledCheckbox(const QString& id) const;

    /**
     * @brief Check a radio and uncheck every other radio in its group.
     *
     * Groups span pages.
     */
    AnnotationCollection withRadioSelected(const QString& id) const;

    // ===== Serialization =====

    QJsonArray toJson() const;
    QByteArray toJsonBytes() const;

    /**
     * @brief Parse a JSON array; entries of unknown type are skipped.
     */
    static AnnotationCollection fromJson(const QJsonArray& array);

    bool operator==(const AnnotationCollection& other) const;
    bool operator!=(const AnnotationCollection& other) const { return !(*this == other); }

private:
    std::vector<std::unique_ptr<Annotation>> m_items;
};
