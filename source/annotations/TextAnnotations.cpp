#include "TextAnnotations.h"
#include "AnnotationJson.h"

#include <QCoreApplication>
#include <QtMath>

// ============================================================================
// TextAnnotation
// ============================================================================

QJsonObject TextAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["text"] = text;
    obj["fontSize"] = fontSize;
    obj["fontFamily"] = fontFamily;
    obj["color"] = colorToJson(color);
    obj["bold"] = bold;
    obj["italic"] = italic;
    return obj;
}

void TextAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    text = obj["text"].toString();
    fontSize = obj["fontSize"].toDouble(14);
    fontFamily = obj["fontFamily"].toString(QStringLiteral("Helvetica"));
    color = colorFromJson(obj["color"], Qt::black);
    bold = obj["bold"].toBool(false);
    italic = obj["italic"].toBool(false);
}

bool TextAnnotation::validate(QString* errorMessage) const
{
    if (!Annotation::validate(errorMessage)) {
        return false;
    }
    if (fontFamily.isEmpty() || !(fontSize > 0)) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Text needs a font family and a positive font size");
        }
        return false;
    }
    return true;
}

QSizeF TextAnnotation::estimatedSize(const QString& text, qreal fontSize)
{
    const QStringList lines = text.split(QLatin1Char('\n'));
    int maxLength = 10;
    for (const QString& line : lines) {
        maxLength = qMax(maxLength, static_cast<int>(line.length()));
    }
    const qreal width = qMax(maxLength * fontSize * CHAR_WIDTH_FACTOR, 50.0);
    const qreal height = qMax(lines.size() * fontSize * LINE_HEIGHT_FACTOR,
                              fontSize * LINE_HEIGHT_FACTOR);
    return QSizeF(width, height);
}

// ============================================================================
// DateAnnotation
// ============================================================================

QJsonObject DateAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["text"] = text;
    obj["fontSize"] = fontSize;
    obj["fontFamily"] = fontFamily;
    obj["color"] = colorToJson(color);
    obj["format"] = format;
    return obj;
}

void DateAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    text = obj["text"].toString();
    fontSize = obj["fontSize"].toDouble(14);
    fontFamily = obj["fontFamily"].toString(QStringLiteral("Helvetica"));
    color = colorFromJson(obj["color"], Qt::black);
    format = obj["format"].toString(QStringLiteral("MM/DD/YYYY"));
}

bool DateAnnotation::validate(QString* errorMessage) const
{
    if (!Annotation::validate(errorMessage)) {
        return false;
    }
    if (fontFamily.isEmpty() || !(fontSize > 0)) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Date needs a font family and a positive font size");
        }
        return false;
    }
    return true;
}

QStringList DateAnnotation::supportedFormats()
{
    return {
        QStringLiteral("MM/DD/YYYY"),
        QStringLiteral("DD/MM/YYYY"),
        QStringLiteral("YYYY-MM-DD"),
        QStringLiteral("MMM DD, YYYY"),
        QStringLiteral("DD MMM YYYY"),
        QStringLiteral("MMMM DD, YYYY")
    };
}

QString DateAnnotation::formatDate(const QDate& date, const QString& pattern)
{
    static const char* const longMonths[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"
    };

    const QString mm = QStringLiteral("%1").arg(date.month(), 2, 10, QLatin1Char('0'));
    const QString dd = QStringLiteral("%1").arg(date.day(), 2, 10, QLatin1Char('0'));
    const QString yyyy = QString::number(date.year());
    const QString longMonth = QString::fromLatin1(longMonths[date.month() - 1]);
    const QString shortMonth = longMonth.left(3);

    if (pattern == QLatin1String("DD/MM/YYYY")) {
        return dd + QLatin1Char('/') + mm + QLatin1Char('/') + yyyy;
    }
    if (pattern == QLatin1String("YYYY-MM-DD")) {
        return yyyy + QLatin1Char('-') + mm + QLatin1Char('-') + dd;
    }
    if (pattern == QLatin1String("MMM DD, YYYY")) {
        return shortMonth + QLatin1Char(' ') + dd + QStringLiteral(", ") + yyyy;
    }
    if (pattern == QLatin1String("DD MMM YYYY")) {
        return dd + QLatin1Char(' ') + shortMonth + QLatin1Char(' ') + yyyy;
    }
    if (pattern == QLatin1String("MMMM DD, YYYY")) {
        return longMonth + QLatin1Char(' ') + dd + QStringLiteral(", ") + yyyy;
    }
    return mm + QLatin1Char('/') + dd + QLatin1Char('/') + yyyy;
}
