#pragma once

// ============================================================================
// FormAnnotations - Checkbox and radio button widgets
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "Annotation.h"

class CheckboxAnnotation : public Annotation {
public:
    bool checked = false;

    AnnotationType type() const override { return AnnotationType::Checkbox; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<CheckboxAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
};

/**
 * @brief Radio button; at most one radio per groupId is checked.
 *
 * The group constraint spans pages and is enforced by
 * AnnotationCollection::withRadioSelected(), not by this class.
 */
class RadioAnnotation : public Annotation {
public:
    bool checked = false;
    QString groupId;

    AnnotationType type() const override { return AnnotationType::Radio; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<RadioAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;

    static QString groupIdFor(int groupNumber) {
        return QStringLiteral("group-%1").arg(groupNumber);
    }
};
