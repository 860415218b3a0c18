#include "ShapeAnnotations.h"
#include "AnnotationJson.h"

// ============================================================================
// OutlineShapeAnnotation
// ============================================================================

QJsonObject OutlineShapeAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["color"] = colorToJson(color);
    obj["strokeWidth"] = strokeWidth;
    obj["fill"] = fill;
    obj["fillColor"] = colorToJson(fillColor);
    return obj;
}

void OutlineShapeAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    color = colorFromJson(obj["color"], Qt::black);
    strokeWidth = obj["strokeWidth"].toDouble(2);
    fill = obj["fill"].toBool(false);
    fillColor = colorFromJson(obj["fillColor"], Qt::white);
}

// ============================================================================
// SegmentAnnotation
// ============================================================================

QJsonObject SegmentAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["x1"] = p1.x();
    obj["y1"] = p1.y();
    obj["x2"] = p2.x();
    obj["y2"] = p2.y();
    obj["color"] = colorToJson(color);
    obj["strokeWidth"] = strokeWidth;
    return obj;
}

void SegmentAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    p1 = QPointF(obj["x1"].toDouble(position.x()), obj["y1"].toDouble(position.y()));
    p2 = QPointF(obj["x2"].toDouble(position.x() + size.width()),
                 obj["y2"].toDouble(position.y() + size.height()));
    color = colorFromJson(obj["color"], Qt::black);
    strokeWidth = obj["strokeWidth"].toDouble(2);
}

void SegmentAnnotation::setBoundingRect(const QRectF& rect)
{
    // Endpoints keep their relative position inside the box
    const QRectF old = boundingRect();
    auto remap = [&](const QPointF& pt) {
        const qreal fx = old.width() > 0 ? (pt.x() - old.x()) / old.width() : 0.0;
        const qreal fy = old.height() > 0 ? (pt.y() - old.y()) / old.height() : 0.0;
        return QPointF(rect.x() + fx * rect.width(), rect.y() + fy * rect.height());
    };
    p1 = remap(p1);
    p2 = remap(p2);
    Annotation::setBoundingRect(rect);
}

// ============================================================================
// HighlightAnnotation
// ============================================================================

QJsonObject HighlightAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["color"] = colorToJson(color);
    obj["opacity"] = opacity;
    return obj;
}

void HighlightAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    color = colorFromJson(obj["color"], QColor(0xFF, 0xFF, 0x00));
    opacity = obj["opacity"].toDouble(0.35);
}

// ============================================================================
// StrikethroughAnnotation
// ============================================================================

QJsonObject StrikethroughAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["color"] = colorToJson(color);
    obj["strokeWidth"] = strokeWidth;
    obj["isRedact"] = isRedact;
    return obj;
}

void StrikethroughAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    color = colorFromJson(obj["color"], Qt::black);
    strokeWidth = obj["strokeWidth"].toDouble(2);
    isRedact = obj["isRedact"].toBool(false);
}
