#pragma once

// ============================================================================
// PdfFlattener - Export payload shared by the flattening backends
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Annotations are captured in content coordinates, i.e. PDF points scaled by
// the render scale the page was displayed at. The scale travels with the
// payload so the backend can bring every coordinate back to points:
//
//   point = content / canvasScale
//
// for x, y, width, height, fontSize, strokeWidth, x1, y1, x2, y2 and every
// freehand path point. A scale of 1.0 is the identity.
// ============================================================================

#include <QByteArray>
#include <QJsonArray>
#include <QString>

class AnnotationCollection;

/**
 * @brief Input to a flatten operation.
 */
struct FlattenRequest {
    QByteArray document;          ///< Original PDF bytes
    QByteArray annotationsJson;   ///< JSON array text in content coordinates
    qreal canvasScale = 1.5;      ///< Render scale the coordinates were captured at
    int exportDpi = 150;          ///< Resolution of the baked annotation layer
};

/**
 * @brief Output of a flatten operation.
 */
struct FlattenResult {
    bool success = false;
    QString errorMessage;
    QByteArray document;          ///< Flattened PDF bytes
    qint64 sizeBytes = 0;
    int pagesFlattened = 0;       ///< Pages that received an annotation layer
    QString downloadName = QStringLiteral("filled.pdf");
};

namespace PdfFlattenPayload {

/**
 * @brief Package the document, the serialized collection and the scale.
 */
FlattenRequest buildRequest(const QByteArray& document, const AnnotationCollection& annotations,
                            qreal canvasScale);

/**
 * @brief Convert content-coordinate annotation JSON to PDF points.
 *
 * Non-positive scales are treated as 1.0.
 */
QJsonArray normalizeAnnotations(const QJsonArray& annotations, qreal canvasScale);

/**
 * @brief Parse the payload's annotation array.
 * @return false with errorMessage set if the text is not a JSON array.
 */
bool parseAnnotations(const QByteArray& json, AnnotationCollection* annotations, QString* errorMessage);

/**
 * @brief Result for a payload without annotations: the original bytes.
 */
FlattenResult identityResult(const QByteArray& document);

} // namespace PdfFlattenPayload
