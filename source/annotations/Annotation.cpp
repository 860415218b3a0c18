// ============================================================================
// Annotation - Implementation
// ============================================================================

#include "Annotation.h"
#include "DrawingAnnotation.h"
#include "FormAnnotations.h"
#include "RasterAnnotations.h"
#include "ShapeAnnotations.h"
#include "StampAnnotations.h"
#include "TextAnnotations.h"

#include <QCoreApplication>
#include <QDebug>
#include <QUuid>

// ============================================================================
// Type names
// ============================================================================

QString annotationTypeName(AnnotationType type)
{
    switch (type) {
        case AnnotationType::Text:          return QStringLiteral("text");
        case AnnotationType::Drawing:       return QStringLiteral("drawing");
        case AnnotationType::Signature:     return QStringLiteral("signature");
        case AnnotationType::Rectangle:     return QStringLiteral("rectangle");
        case AnnotationType::Line:          return QStringLiteral("line");
        case AnnotationType::Highlight:     return QStringLiteral("highlight");
        case AnnotationType::Image:         return QStringLiteral("image");
        case AnnotationType::Checkbox:      return QStringLiteral("checkbox");
        case AnnotationType::Circle:        return QStringLiteral("circle");
        case AnnotationType::Arrow:         return QStringLiteral("arrow");
        case AnnotationType::Date:          return QStringLiteral("date");
        case AnnotationType::Stamp:         return QStringLiteral("stamp");
        case AnnotationType::Strikethrough: return QStringLiteral("strikethrough");
        case AnnotationType::Initials:      return QStringLiteral("initials");
        case AnnotationType::Radio:         return QStringLiteral("radio");
        case AnnotationType::SignedStamp:   return QStringLiteral("signedStamp");
        case AnnotationType::Watermark:     return QStringLiteral("watermark");
    }
    return QString();
}

AnnotationType annotationTypeFromName(const QString& name, bool* ok)
{
    static const AnnotationType allTypes[] = {
        AnnotationType::Text, AnnotationType::Drawing, AnnotationType::Signature,
        AnnotationType::Rectangle, AnnotationType::Line, AnnotationType::Highlight,
        AnnotationType::Image, AnnotationType::Checkbox, AnnotationType::Circle,
        AnnotationType::Arrow, AnnotationType::Date, AnnotationType::Stamp,
        AnnotationType::Strikethrough, AnnotationType::Initials, AnnotationType::Radio,
        AnnotationType::SignedStamp, AnnotationType::Watermark
    };
    for (AnnotationType type : allTypes) {
        if (annotationTypeName(type) == name) {
            if (ok) *ok = true;
            return type;
        }
    }
    if (ok) *ok = false;
    return AnnotationType::Text;
}

QString annotationIdPrefix(AnnotationType type)
{
    switch (type) {
        case AnnotationType::Text:          return QStringLiteral("text");
        case AnnotationType::Drawing:       return QStringLiteral("draw");
        case AnnotationType::Signature:     return QStringLiteral("sig");
        case AnnotationType::Rectangle:     return QStringLiteral("rect");
        case AnnotationType::Line:          return QStringLiteral("line");
        case AnnotationType::Highlight:     return QStringLiteral("hl");
        case AnnotationType::Image:         return QStringLiteral("img");
        case AnnotationType::Checkbox:      return QStringLiteral("cb");
        case AnnotationType::Circle:        return QStringLiteral("circle");
        case AnnotationType::Arrow:         return QStringLiteral("arrow");
        case AnnotationType::Date:          return QStringLiteral("date");
        case AnnotationType::Stamp:         return QStringLiteral("stamp");
        case AnnotationType::Strikethrough: return QStringLiteral("strike");
        case AnnotationType::Initials:      return QStringLiteral("init");
        case AnnotationType::Radio:         return QStringLiteral("radio");
        case AnnotationType::SignedStamp:   return QStringLiteral("signedStamp");
        case AnnotationType::Watermark:     return QStringLiteral("watermark");
    }
    return QStringLiteral("annotation");
}

// ============================================================================
// Serialization
// ============================================================================

QJsonObject Annotation::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["type"] = typeName();
    obj["page"] = page;
    obj["x"] = position.x();
    obj["y"] = position.y();
    obj["width"] = size.width();
    obj["height"] = size.height();
    return obj;
}

void Annotation::loadFromJson(const QJsonObject& obj)
{
    id = obj["id"].toString();
    page = obj["page"].toInt(1);
    position = QPointF(obj["x"].toDouble(), obj["y"].toDouble());
    size = QSizeF(obj["width"].toDouble(), obj["height"].toDouble());

    if (id.isEmpty()) {
        id = generateId(type());
    }
}

bool Annotation::validate(QString* errorMessage) const
{
    if (id.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Annotation has no id");
        }
        return false;
    }
    if (page < 1) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Invalid page number: %1").arg(page);
        }
        return false;
    }
    if (!(size.width() > 0) || !(size.height() > 0)) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Annotation must have a positive size");
        }
        return false;
    }
    return true;
}

void Annotation::setBoundingRect(const QRectF& rect)
{
    position = rect.topLeft();
    size = rect.size();
}

void Annotation::applyPatch(const QJsonObject& patch)
{
    QJsonObject merged = toJson();
    for (auto it = patch.constBegin(); it != patch.constEnd(); ++it) {
        const QString& key = it.key();
        if (key == QLatin1String("id") || key == QLatin1String("type") || key == QLatin1String("page")) {
            continue;
        }
        merged[key] = it.value();
    }
    loadFromJson(merged);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Annotation> Annotation::createEmpty(AnnotationType type)
{
    switch (type) {
        case AnnotationType::Text:          return std::make_unique<TextAnnotation>();
        case AnnotationType::Drawing:       return std::make_unique<DrawingAnnotation>();
        case AnnotationType::Signature:     return std::make_unique<SignatureAnnotation>();
        case AnnotationType::Rectangle:     return std::make_unique<RectangleAnnotation>();
        case AnnotationType::Line:          return std::make_unique<LineAnnotation>();
        case AnnotationType::Highlight:     return std::make_unique<HighlightAnnotation>();
        case AnnotationType::Image:         return std::make_unique<ImageAnnotation>();
        case AnnotationType::Checkbox:      return std::make_unique<CheckboxAnnotation>();
        case AnnotationType::Circle:        return std::make_unique<CircleAnnotation>();
        case AnnotationType::Arrow:         return std::make_unique<ArrowAnnotation>();
        case AnnotationType::Date:          return std::make_unique<DateAnnotation>();
        case AnnotationType::Stamp:         return std::make_unique<StampAnnotation>();
        case AnnotationType::Strikethrough: return std::make_unique<StrikethroughAnnotation>();
        case AnnotationType::Initials:      return std::make_unique<InitialsAnnotation>();
        case AnnotationType::Radio:         return std::make_unique<RadioAnnotation>();
        case AnnotationType::SignedStamp:   return std::make_unique<SignedStampAnnotation>();
        case AnnotationType::Watermark:     return std::make_unique<WatermarkAnnotation>();
    }
    return nullptr;
}

std::unique_ptr<Annotation> Annotation::fromJson(const QJsonObject& obj)
{
    bool known = false;
    AnnotationType annotationType = annotationTypeFromName(obj["type"].toString(), &known);
    if (!known) {
        qWarning() << "[Annotation] Skipping unknown annotation type:" << obj["type"].toString();
        return nullptr;
    }

    std::unique_ptr<Annotation> result = createEmpty(annotationType);
    if (result) {
        result->loadFromJson(obj);
    }
    return result;
}

QString Annotation::generateId(AnnotationType type)
{
    return annotationIdPrefix(type) + QLatin1Char('-')
         + QUuid::createUuid().toString(QUuid::WithoutBraces);
}
