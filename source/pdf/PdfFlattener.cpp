#include "PdfFlattener.h"
#include "../annotations/AnnotationCollection.h"

#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace {

const char* const SCALED_FIELDS[] = {
    "x", "y", "width", "height", "fontSize", "strokeWidth", "x1", "y1", "x2", "y2"
};

QJsonArray normalizePaths(const QJsonArray& paths, qreal scale)
{
    QJsonArray out;
    for (const QJsonValue& pathValue : paths) {
        QJsonObject path = pathValue.toObject();
        QJsonArray points;
        for (const QJsonValue& pointValue : path.value(QStringLiteral("points")).toArray()) {
            QJsonObject point = pointValue.toObject();
            point.insert(QStringLiteral("x"), point.value(QStringLiteral("x")).toDouble() / scale);
            point.insert(QStringLiteral("y"), point.value(QStringLiteral("y")).toDouble() / scale);
            points.append(point);
        }
        path.insert(QStringLiteral("points"), points);
        out.append(path);
    }
    return out;
}

} // namespace

namespace PdfFlattenPayload {

FlattenRequest buildRequest(const QByteArray& document, const AnnotationCollection& annotations,
                            qreal canvasScale)
{
    FlattenRequest request;
    request.document = document;
    request.annotationsJson = annotations.toJsonBytes();
    request.canvasScale = canvasScale;
    return request;
}

QJsonArray normalizeAnnotations(const QJsonArray& annotations, qreal canvasScale)
{
    const qreal scale = canvasScale > 0 ? canvasScale : 1.0;
    if (qFuzzyCompare(scale, 1.0)) {
        return annotations;
    }

    QJsonArray out;
    for (const QJsonValue& value : annotations) {
        QJsonObject obj = value.toObject();
        for (const char* field : SCALED_FIELDS) {
            const QString key = QString::fromLatin1(field);
            const QJsonValue v = obj.value(key);
            if (v.isDouble()) {
                obj.insert(key, v.toDouble() / scale);
            }
        }
        if (obj.value(QStringLiteral("paths")).isArray()) {
            obj.insert(QStringLiteral("paths"), normalizePaths(obj.value(QStringLiteral("paths")).toArray(), scale));
        }
        out.append(obj);
    }
    return out;
}

bool parseAnnotations(const QByteArray& json, AnnotationCollection* annotations, QString* errorMessage)
{
    if (json.trimmed().isEmpty()) {
        *annotations = AnnotationCollection();
        return true;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("PdfFlattener", "Invalid annotation payload: %1")
                                .arg(parseError.error != QJsonParseError::NoError
                                         ? parseError.errorString()
                                         : QStringLiteral("expected an array"));
        }
        return false;
    }

    *annotations = AnnotationCollection::fromJson(doc.array());
    return true;
}

FlattenResult identityResult(const QByteArray& document)
{
    FlattenResult result;
    result.success = true;
    result.document = document;
    result.sizeBytes = document.size();
    result.pagesFlattened = 0;
    return result;
}

} // namespace PdfFlattenPayload
