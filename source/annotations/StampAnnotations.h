#pragma once

// ============================================================================
// StampAnnotations - Rubber stamps, signed stamps and watermarks
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "Annotation.h"

#include <QColor>
#include <QVector>

enum class StampShape { Box, Circle };

enum class SignedStampStyle {
    Modern,    ///< Clean single border
    Classic,   ///< Thick border, inner ring, slight tilt, worn alpha
    Official   ///< Double border, decorative dots on circles
};

enum class StampTextLayout { Curved, Straight };

enum class WatermarkContentType { Text, Image };

enum class WatermarkBorderStyle { None, Solid, Dashed, Dotted };

QString stampShapeName(StampShape shape);
StampShape stampShapeFromName(const QString& name);
QString signedStampStyleName(SignedStampStyle style);
SignedStampStyle signedStampStyleFromName(const QString& name);
QString stampTextLayoutName(StampTextLayout layout);
StampTextLayout stampTextLayoutFromName(const QString& name);
QString watermarkContentTypeName(WatermarkContentType type);
WatermarkContentType watermarkContentTypeFromName(const QString& name);
QString watermarkBorderStyleName(WatermarkBorderStyle style);
WatermarkBorderStyle watermarkBorderStyleFromName(const QString& name);

/**
 * @brief A predefined stamp label with its default color.
 */
struct StampPreset {
    QString id;      ///< "approved", "draft", ...
    QString label;   ///< Text drawn inside the stamp
    QColor color;
};

/**
 * @brief Rubber stamp with a preset or custom label.
 *
 * Painted rotated by `rotation` degrees about the box center.
 */
class StampAnnotation : public Annotation {
public:
    QString stampType = QStringLiteral("approved");  ///< Preset id or "custom"
    QString customText;
    QColor color = QColor(0x16, 0xa3, 0x4a);
    qreal rotation = 0;
    bool isDashed = false;
    StampShape shape = StampShape::Box;

    AnnotationType type() const override { return AnnotationType::Stamp; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<StampAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;

    /**
     * @brief The text drawn inside the stamp.
     *
     * Custom stamps use customText ("CUSTOM" if empty); unknown preset ids
     * fall back to "STAMP".
     */
    QString label() const;

    static const QVector<StampPreset>& presets();
    static const StampPreset* findPreset(const QString& id);
};

/**
 * @brief Stamp combining a heading, a signature image and a date.
 */
class SignedStampAnnotation : public Annotation {
public:
    QString stampText = QStringLiteral("APPROVED BY");
    QString signatureData;   ///< Data URL of the signature bitmap
    QString dateText;
    QColor borderColor = QColor(0x1e, 0x40, 0xaf);
    bool isDashed = false;
    StampShape shape = StampShape::Circle;
    SignedStampStyle stampStyle = SignedStampStyle::Classic;
    StampTextLayout textLayout = StampTextLayout::Curved;

    AnnotationType type() const override { return AnnotationType::SignedStamp; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<SignedStampAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;
};

/**
 * @brief Translucent rotated text or image.
 */
class WatermarkAnnotation : public Annotation {
public:
    QString content;   ///< Text, or data URL when contentType is Image
    WatermarkContentType contentType = WatermarkContentType::Text;
    QColor color = QColor(0x6b, 0x72, 0x80);
    qreal opacity = 0.3;
    qreal rotation = -45;
    qreal fontSize = 48;
    WatermarkBorderStyle borderStyle = WatermarkBorderStyle::None;
    QColor borderColor = QColor(0x6b, 0x72, 0x80);

    AnnotationType type() const override { return AnnotationType::Watermark; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<WatermarkAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;
};
