#pragma once

// ============================================================================
// DrawingAnnotation - Freehand ink
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "Annotation.h"

#include <QColor>
#include <QVector>

/**
 * @brief One continuous polyline (pointer down to pointer up).
 */
struct DrawingPath {
    QVector<QPointF> points;

    bool operator==(const DrawingPath& other) const { return points == other.points; }
};

/**
 * @brief Freehand drawing made of one or more paths.
 *
 * The bounding box is the extent of all path points, at least 1 x 1.
 */
class DrawingAnnotation : public Annotation {
public:
    QVector<DrawingPath> paths;
    QColor color = Qt::black;
    qreal strokeWidth = 2;

    AnnotationType type() const override { return AnnotationType::Drawing; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<DrawingAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;
    void setBoundingRect(const QRectF& rect) override;

    /**
     * @brief Check whether any stroke point lies strictly within radius of pt.
     *
     * Used by the eraser. Only recorded points are tested, not the segments
     * between them.
     */
    bool hasPointNear(const QPointF& pt, qreal radius) const;

    /**
     * @brief Extent of a point list; width and height are clamped to >= 1.
     */
    static QRectF boundsOf(const QVector<QPointF>& points);
};
