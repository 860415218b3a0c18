#include "StampAnnotations.h"
#include "AnnotationJson.h"

#include <QCoreApplication>

// ============================================================================
// Enum names
// ============================================================================

QString stampShapeName(StampShape shape)
{
    return shape == StampShape::Circle ? QStringLiteral("circle") : QStringLiteral("box");
}

StampShape stampShapeFromName(const QString& name)
{
    return name == QLatin1String("circle") ? StampShape::Circle : StampShape::Box;
}

QString signedStampStyleName(SignedStampStyle style)
{
    switch (style) {
        case SignedStampStyle::Modern:   return QStringLiteral("modern");
        case SignedStampStyle::Classic:  return QStringLiteral("classic");
        case SignedStampStyle::Official: return QStringLiteral("official");
    }
    return QStringLiteral("classic");
}

SignedStampStyle signedStampStyleFromName(const QString& name)
{
    if (name == QLatin1String("modern")) return SignedStampStyle::Modern;
    if (name == QLatin1String("official")) return SignedStampStyle::Official;
    return SignedStampStyle::Classic;
}

QString stampTextLayoutName(StampTextLayout layout)
{
    return layout == StampTextLayout::Straight ? QStringLiteral("straight") : QStringLiteral("curved");
}

StampTextLayout stampTextLayoutFromName(const QString& name)
{
    return name == QLatin1String("straight") ? StampTextLayout::Straight : StampTextLayout::Curved;
}

QString watermarkContentTypeName(WatermarkContentType type)
{
    return type == WatermarkContentType::Image ? QStringLiteral("image") : QStringLiteral("text");
}

WatermarkContentType watermarkContentTypeFromName(const QString& name)
{
    return name == QLatin1String("image") ? WatermarkContentType::Image : WatermarkContentType::Text;
}

QString watermarkBorderStyleName(WatermarkBorderStyle style)
{
    switch (style) {
        case WatermarkBorderStyle::None:   return QStringLiteral("none");
        case WatermarkBorderStyle::Solid:  return QStringLiteral("solid");
        case WatermarkBorderStyle::Dashed: return QStringLiteral("dashed");
        case WatermarkBorderStyle::Dotted: return QStringLiteral("dotted");
    }
    return QStringLiteral("none");
}

WatermarkBorderStyle watermarkBorderStyleFromName(const QString& name)
{
    if (name == QLatin1String("solid")) return WatermarkBorderStyle::Solid;
    if (name == QLatin1String("dashed")) return WatermarkBorderStyle::Dashed;
    if (name == QLatin1String("dotted")) return WatermarkBorderStyle::Dotted;
    return WatermarkBorderStyle::None;
}

// ============================================================================
// StampAnnotation
// ============================================================================

const QVector<StampPreset>& StampAnnotation::presets()
{
    static const QVector<StampPreset> list = {
        { QStringLiteral("approved"),     QStringLiteral("APPROVED"),     QColor(0x16, 0xa3, 0x4a) },
        { QStringLiteral("draft"),        QStringLiteral("DRAFT"),        QColor(0x6b, 0x72, 0x80) },
        { QStringLiteral("confidential"), QStringLiteral("CONFIDENTIAL"), QColor(0xdc, 0x26, 0x26) },
        { QStringLiteral("paid"),         QStringLiteral("PAID"),         QColor(0x16, 0xa3, 0x4a) },
        { QStringLiteral("rejected"),     QStringLiteral("REJECTED"),     QColor(0xdc, 0x26, 0x26) },
        { QStringLiteral("final"),        QStringLiteral("FINAL"),        QColor(0x25, 0x63, 0xeb) },
        { QStringLiteral("copy"),         QStringLiteral("COPY"),         QColor(0x93, 0x33, 0xea) },
        { QStringLiteral("void"),         QStringLiteral("VOID"),         QColor(0xdc, 0x26, 0x26) },
    };
    return list;
}

const StampPreset* StampAnnotation::findPreset(const QString& presetId)
{
    for (const StampPreset& preset : presets()) {
        if (preset.id == presetId) {
            return &preset;
        }
    }
    return nullptr;
}

QString StampAnnotation::label() const
{
    if (stampType == QLatin1String("custom")) {
        return customText.isEmpty() ? QStringLiteral("CUSTOM") : customText;
    }
    const StampPreset* preset = findPreset(stampType);
    return preset ? preset->label : QStringLiteral("STAMP");
}

QJsonObject StampAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["stampType"] = stampType;
    obj["customText"] = customText;
    obj["color"] = colorToJson(color);
    obj["rotation"] = rotation;
    obj["isDashed"] = isDashed;
    obj["shape"] = stampShapeName(shape);
    return obj;
}

void StampAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    stampType = obj["stampType"].toString(QStringLiteral("approved"));
    customText = obj["customText"].toString();
    color = colorFromJson(obj["color"], QColor(0x16, 0xa3, 0x4a));
    rotation = obj["rotation"].toDouble(0);
    isDashed = obj["isDashed"].toBool(false);
    shape = stampShapeFromName(obj["shape"].toString());
}

// ============================================================================
// SignedStampAnnotation
// ============================================================================

QJsonObject SignedStampAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["stampText"] = stampText;
    obj["signatureData"] = signatureData;
    obj["dateText"] = dateText;
    obj["borderColor"] = colorToJson(borderColor);
    obj["isDashed"] = isDashed;
    obj["shape"] = stampShapeName(shape);
    obj["stampStyle"] = signedStampStyleName(stampStyle);
    obj["textLayout"] = stampTextLayoutName(textLayout);
    return obj;
}

void SignedStampAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    stampText = obj["stampText"].toString(QStringLiteral("APPROVED BY"));
    signatureData = obj["signatureData"].toString();
    dateText = obj["dateText"].toString();
    borderColor = colorFromJson(obj["borderColor"], QColor(0x1e, 0x40, 0xaf));
    isDashed = obj["isDashed"].toBool(false);
    shape = stampShapeFromName(obj["shape"].toString(QStringLiteral("circle")));
    stampStyle = signedStampStyleFromName(obj["stampStyle"].toString());
    textLayout = stampTextLayoutFromName(obj["textLayout"].toString());
}

bool SignedStampAnnotation::validate(QString* errorMessage) const
{
    if (!Annotation::validate(errorMessage)) {
        return false;
    }
    if (signatureData.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Please draw or upload a signature");
        }
        return false;
    }
    return true;
}

// ============================================================================
// WatermarkAnnotation
// ============================================================================

QJsonObject WatermarkAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["content"] = content;
    obj["contentType"] = watermarkContentTypeName(contentType);
    obj["color"] = colorToJson(color);
    obj["opacity"] = opacity;
    obj["rotation"] = rotation;
    obj["fontSize"] = fontSize;
    obj["borderStyle"] = watermarkBorderStyleName(borderStyle);
    obj["borderColor"] = colorToJson(borderColor);
    return obj;
}

void WatermarkAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    content = obj["content"].toString();
    contentType = watermarkContentTypeFromName(obj["contentType"].toString());
    color = colorFromJson(obj["color"], QColor(0x6b, 0x72, 0x80));
    opacity = obj["opacity"].toDouble(0.3);
    rotation = obj["rotation"].toDouble(-45);
    fontSize = obj["fontSize"].toDouble(48);
    borderStyle = watermarkBorderStyleFromName(obj["borderStyle"].toString());
    borderColor = colorFromJson(obj["borderColor"], QColor(0x6b, 0x72, 0x80));
}

bool WatermarkAnnotation::validate(QString* errorMessage) const
{
    // Empty text also yields a zero-width box; report the content first
    if (content.isEmpty()) {
        if (errorMessage) {
            *errorMessage = contentType == WatermarkContentType::Image
                ? QCoreApplication::translate("Annotation", "Please upload an image")
                : QCoreApplication::translate("Annotation", "Please enter watermark text");
        }
        return false;
    }
    return Annotation::validate(errorMessage);
}
