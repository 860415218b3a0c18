#include "AnnotationFactory.h"
#include "AnnotationJson.h"
#include "FormAnnotations.h"
#include "ShapeAnnotations.h"
#include "../core/ToolSettings.h"

#include <QCoreApplication>
#include <QDebug>

QJsonObject AnnotationFactory::styleDefaults(AnnotationType type, const ToolSettings& style)
{
    QJsonObject obj;
    switch (type) {
        case AnnotationType::Text:
            obj["text"] = QString();
            obj["fontSize"] = style.fontSize;
            obj["fontFamily"] = style.fontFamily;
            obj["color"] = colorToJson(style.strokeColor);
            obj["bold"] = false;
            obj["italic"] = false;
            break;
        case AnnotationType::Date:
            obj["fontSize"] = style.fontSize;
            obj["fontFamily"] = style.fontFamily;
            obj["color"] = colorToJson(style.strokeColor);
            obj["format"] = style.dateFormat;
            break;
        case AnnotationType::Drawing:
        case AnnotationType::Line:
        case AnnotationType::Arrow:
            obj["color"] = colorToJson(style.strokeColor);
            obj["strokeWidth"] = style.strokeWidth;
            break;
        case AnnotationType::Rectangle:
        case AnnotationType::Circle:
            obj["color"] = colorToJson(style.strokeColor);
            obj["strokeWidth"] = style.strokeWidth;
            obj["fill"] = false;
            obj["fillColor"] = colorToJson(Qt::white);
            break;
        case AnnotationType::Highlight:
            obj["color"] = colorToJson(style.highlightColor);
            obj["opacity"] = 0.35;
            break;
        case AnnotationType::Strikethrough:
            obj["color"] = colorToJson(style.strokeColor);
            obj["strokeWidth"] = style.strokeWidth;
            obj["isRedact"] = style.redactMode;
            break;
        case AnnotationType::Signature:
            obj["data"] = style.signatureData;
            break;
        case AnnotationType::Initials:
            obj["data"] = style.initialsData;
            break;
        case AnnotationType::Image:
            obj["data"] = style.stagedImageData;
            break;
        case AnnotationType::Checkbox:
            obj["checked"] = false;
            break;
        case AnnotationType::Radio:
            obj["checked"] = false;
            obj["groupId"] = RadioAnnotation::groupIdFor(style.radioGroup);
            break;
        case AnnotationType::Stamp:
            obj["stampType"] = style.stampType;
            obj["customText"] = style.stampCustomText;
            obj["color"] = colorToJson(style.stampColor);
            obj["rotation"] = style.stampShape == StampShape::Circle ? 0.0 : -15.0;
            obj["isDashed"] = style.stampDashed;
            obj["shape"] = stampShapeName(style.stampShape);
            break;
        case AnnotationType::SignedStamp:
            obj["stampText"] = style.signedStampText;
            obj["signatureData"] = style.signatureData;
            obj["borderColor"] = colorToJson(style.signedStampColor);
            obj["isDashed"] = style.signedStampDashed;
            obj["shape"] = stampShapeName(style.signedStampShape);
            obj["stampStyle"] = signedStampStyleName(style.signedStampStyle);
            obj["textLayout"] = stampTextLayoutName(style.signedStampLayout);
            break;
        case AnnotationType::Watermark:
            obj["contentType"] = watermarkContentTypeName(style.watermarkContentType);
            obj["content"] = style.watermarkContentType == WatermarkContentType::Image
                ? style.stagedImageData : style.watermarkText;
            obj["color"] = colorToJson(style.watermarkColor);
            obj["opacity"] = style.watermarkOpacity;
            obj["rotation"] = style.watermarkRotation;
            obj["fontSize"] = style.watermarkFontSize;
            obj["borderStyle"] = watermarkBorderStyleName(style.watermarkBorderStyle);
            obj["borderColor"] = colorToJson(style.watermarkBorderColor);
            break;
    }
    return obj;
}

std::unique_ptr<Annotation> AnnotationFactory::create(AnnotationType type, int page,
                                                      const QRectF& bounds,
                                                      const ToolSettings& style,
                                                      const QJsonObject& payload,
                                                      QString* errorMessage)
{
    QJsonObject obj = styleDefaults(type, style);
    for (auto it = payload.constBegin(); it != payload.constEnd(); ++it) {
        obj[it.key()] = it.value();
    }

    // Identity and geometry always come from the arguments
    obj["id"] = Annotation::generateId(type);
    obj["type"] = annotationTypeName(type);
    obj["page"] = page;
    obj["x"] = bounds.x();
    obj["y"] = bounds.y();
    obj["width"] = bounds.width();
    obj["height"] = bounds.height();

    std::unique_ptr<Annotation> annotation = Annotation::fromJson(obj);
    if (!annotation) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("AnnotationFactory", "Unknown annotation type");
        }
        return nullptr;
    }

    QString error;
    if (!annotation->validate(&error)) {
        qDebug() << "[AnnotationFactory] Rejected" << annotation->typeName() << ":" << error;
        if (errorMessage) {
            *errorMessage = error;
        }
        return nullptr;
    }
    return annotation;
}
