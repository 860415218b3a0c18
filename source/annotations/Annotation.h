#pragma once

// ============================================================================
// Annotation - Base class for every markup placed on a PDF page
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// All variants share a bounding box in page content coordinates (the pixel
// grid of the page rendered at the fixed render scale) and a 1-based page
// number. Variant payloads live in the subclasses:
// - TextAnnotation, DateAnnotation            (TextAnnotations.h)
// - DrawingAnnotation                         (DrawingAnnotation.h)
// - Rectangle/Circle/Line/Arrow/Highlight/Strikethrough (ShapeAnnotations.h)
// - Signature/Initials/Image                  (RasterAnnotations.h)
// - Checkbox/Radio                            (FormAnnotations.h)
// - Stamp/SignedStamp/Watermark               (StampAnnotations.h)
//
// Annotations are plain data. Painting lives in AnnotationRenderer and
// hit testing in HitTesting; both switch over type().
// ============================================================================

#include "AnnotationType.h"

#include <QJsonObject>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include <memory>

/**
 * @brief Abstract base class for annotations.
 *
 * id and page are fixed once the annotation is placed. position and size
 * form the axis-aligned bounding box; width and height are positive for
 * every committed annotation.
 */
class Annotation {
public:
    // ===== Common Properties =====
    QString id;           ///< Unique within a collection, never reassigned
    int page = 1;         ///< 1-based page the annotation belongs to
    QPointF position;     ///< Top-left corner (content coordinates)
    QSizeF size;          ///< Bounding size (content coordinates)

    virtual ~Annotation() = default;

    /**
     * @brief The variant tag.
     */
    virtual AnnotationType type() const = 0;

    /**
     * @brief Deep copy including id.
     */
    virtual std::unique_ptr<Annotation> clone() const = 0;

    /**
     * @brief Serialize to JSON.
     *
     * Base implementation writes type, id, page, x, y, width and height.
     * Subclasses call it and append their payload.
     */
    virtual QJsonObject toJson() const;

    /**
     * @brief Load common and payload fields from JSON.
     */
    virtual void loadFromJson(const QJsonObject& obj);

    /**
     * @brief Check the variant's required fields.
     * @param errorMessage Receives a description of the first violation.
     * @return true if the annotation may be added to a collection.
     *
     * Base implementation requires a non-empty id and a positive size.
     */
    virtual bool validate(QString* errorMessage) const;

    /**
     * @brief Move/resize the annotation to a new bounding box.
     *
     * Variants with interior geometry (line endpoints, drawing points)
     * override this to carry that geometry along with the box.
     */
    virtual void setBoundingRect(const QRectF& rect);

    // ===== Common Helpers =====

    QRectF boundingRect() const {
        return QRectF(position, size);
    }

    QPointF center() const {
        return position + QPointF(size.width() / 2.0, size.height() / 2.0);
    }

    /**
     * @brief Inclusive containment test against the bounding box.
     */
    bool boundsContain(const QPointF& pt) const {
        return pt.x() >= position.x() && pt.x() <= position.x() + size.width()
            && pt.y() >= position.y() && pt.y() <= position.y() + size.height();
    }

    QString typeName() const { return annotationTypeName(type()); }

    /**
     * @brief Overwrite payload fields from a JSON patch.
     *
     * id, type and page are immutable and ignored if present in the patch.
     */
    void applyPatch(const QJsonObject& patch);

    // ===== Factory Methods =====

    /**
     * @brief Create an annotation from JSON (factory method).
     * @return nullptr if the "type" field is missing or unknown.
     */
    static std::unique_ptr<Annotation> fromJson(const QJsonObject& obj);

    /**
     * @brief Create an empty instance of the given variant.
     */
    static std::unique_ptr<Annotation> createEmpty(AnnotationType type);

    /**
     * @brief Generate a fresh id of the form "<prefix>-<uuid>".
     */
    static QString generateId(AnnotationType type);

protected:
    Annotation() = default;
    Annotation(const Annotation&) = default;
    Annotation& operator=(const Annotation&) = default;
};
