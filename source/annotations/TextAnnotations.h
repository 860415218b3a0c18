#pragma once

// ============================================================================
// TextAnnotations - Free text and date stamps
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "Annotation.h"

#include <QColor>
#include <QDate>
#include <QStringList>

/**
 * @brief Multi-line free text typed in place.
 *
 * The bounding box is an estimate derived from character counts, not from
 * glyph metrics (see estimatedSize()). The flattening backend positions
 * text from the same estimate, so it is kept as is.
 */
class TextAnnotation : public Annotation {
public:
    QString text;
    qreal fontSize = 14;
    QString fontFamily = QStringLiteral("Helvetica");
    QColor color = Qt::black;
    bool bold = false;
    bool italic = false;

    AnnotationType type() const override { return AnnotationType::Text; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<TextAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;

    /**
     * @brief Box size for the given text at the given font size.
     *
     * width  = max(longestLine (at least 10 chars) * fontSize * 0.6, 50)
     * height = max(lineCount * fontSize * 1.2, fontSize * 1.2)
     */
    static QSizeF estimatedSize(const QString& text, qreal fontSize);

    static constexpr qreal CHAR_WIDTH_FACTOR = 0.6;   ///< Average glyph width / font size
    static constexpr qreal LINE_HEIGHT_FACTOR = 1.2;  ///< Line advance / font size
};

/**
 * @brief A formatted date placed as a single line of text.
 */
class DateAnnotation : public Annotation {
public:
    QString text;
    qreal fontSize = 14;
    QString fontFamily = QStringLiteral("Helvetica");
    QColor color = Qt::black;
    QString format = QStringLiteral("MM/DD/YYYY");

    AnnotationType type() const override { return AnnotationType::Date; }
    std::unique_ptr<Annotation> clone() const override {
        return std::make_unique<DateAnnotation>(*this);
    }
    QJsonObject toJson() const override;
    void loadFromJson(const QJsonObject& obj) override;
    bool validate(QString* errorMessage) const override;

    /**
     * @brief Format a date with one of the supported patterns.
     *
     * Supported: "MM/DD/YYYY", "DD/MM/YYYY", "YYYY-MM-DD", "MMM DD, YYYY",
     * "DD MMM YYYY", "MMMM DD, YYYY". Unknown patterns use "MM/DD/YYYY".
     * Month names are English regardless of locale.
     */
    static QString formatDate(const QDate& date, const QString& pattern);

    /**
     * @brief All supported patterns, default first.
     */
    static QStringList supportedFormats();
};
