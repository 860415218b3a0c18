#pragma once

// ============================================================================
// ShapeAnnotations - Vector shapes defined by a drag gesture
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Rectangle and Circle share stroke + optional fill. Line and Arrow store
// their endpoints in addition to the bounding box. Highlight is a
// translucent fill, Strikethrough a middle line or an opaque redaction box.
// ============================================================================

#include "Annotation.h"

#include <QColor>

/**
 * @brief Common payload of rectangle and circle.
 */
class OutlineShapeAnnotation : public Annotation {
public:
    QColor color = Qt::black;
    qreal strokeWidth = 2;
    bool fill = false;
    QColor fillColor = Qt::white;

    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
};

class RectangleAnnotation : public OutlineShapeAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Rectangle; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<RectangleAnnotation>(*this);
    }
};

/**
 * @brief Ellipse inscribed in the bounding box.
 */
class CircleAnnotation : public OutlineShapeAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Circle; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<CircleAnnotation>(*this);
    }
};

/**
 * @brief Common payload of line and arrow.
 *
 * (x1, y1) is where the drag started, (x2, y2) where it ended. The
 * bounding box spans both; a zero extent is stored as 1.
 */
class SegmentAnnotation : public Annotation {
public:
    QPointF p1;
    QPointF p2;
    QColor color = Qt::black;
    qreal strokeWidth = 2;

    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    void setBoundingRect(const QRectF& rect) override;
};

class LineAnnotation : public SegmentAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Line; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<LineAnnotation>(*this);
    }
};

/**
 * @brief Line with a filled head at p2.
 */
class ArrowAnnotation : public SegmentAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Arrow; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<ArrowAnnotation>(*this);
    }

    static constexpr qreal HEAD_LENGTH = 15.0;
};

class HighlightAnnotation : public Annotation {
public:
    QColor color = QColor(0xFF, 0xFF, 0x00);
    qreal opacity = 0.35;

    AnnotationType type() const override { return AnnotationType::Highlight; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<HighlightAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
};

/**
 * @brief Strike-through line, or a solid black box when isRedact is set.
 */
class StrikethroughAnnotation : public Annotation {
public:
    QColor color = Qt::black;
    qreal strokeWidth = 2;
    bool isRedact = false;

    AnnotationType type() const override { return AnnotationType::Strikethrough; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<StrikethroughAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
};
