#pragma once

// ============================================================================
// RasterAnnotations - Annotations carrying an embedded bitmap
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// The bitmap is kept as a data URL ("data:image/png;base64,...") exactly as
// it is sent to the flattening backend. Decoding happens asynchronously in
// RasterCache when the annotation is first painted.
// ============================================================================

#include "Annotation.h"

/**
 * @brief Common payload: the encoded bitmap.
 */
class RasterAnnotation : public Annotation {
public:
    QString data;   ///< Data URL of the bitmap

    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;
};

class SignatureAnnotation : public RasterAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Signature; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<SignatureAnnotation>(*this);
    }
};

class InitialsAnnotation : public RasterAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Initials; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<InitialsAnnotation>(*this);
    }
};

class ImageAnnotation : public RasterAnnotation {
public:
    AnnotationType type() const override { return AnnotationType::Image; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<ImageAnnotation>(*this);
    }
};
