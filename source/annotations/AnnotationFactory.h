#pragma once

// ============================================================================
// AnnotationFactory - Builds validated annotations from tool settings
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "Annotation.h"

#include <QJsonObject>
#include <QRectF>

#include <memory>

struct ToolSettings;

class AnnotationFactory {
public:
    /**
     * @brief Create a new annotation with a fresh id.
     *
     * @param type Variant to create.
     * @param page 1-based page.
     * @param bounds Bounding box in content coordinates.
     * @param style Style defaults (color, stroke width, stamp options...).
     * @param payload Variant fields that override the style defaults
     *        (e.g. "text", "paths", "x1"). id/type/page/geometry keys in
     *        the payload are ignored.
     * @param errorMessage Receives the validation message on failure.
     * @return nullptr if validation fails.
     */
    static std::unique_ptr<Annotation> create(AnnotationType type, int page,
                                              const QRectF& bounds,
                                              const ToolSettings& style,
                                              const QJsonObject& payload = QJsonObject(),
                                              QString* errorMessage = nullptr);

    /**
     * @brief The JSON fields a new annotation of this type starts with.
     */
    static QJsonObject styleDefaults(AnnotationType type, const ToolSettings& style);
};
