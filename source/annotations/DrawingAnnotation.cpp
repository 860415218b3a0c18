#include "DrawingAnnotation.h"
#include "AnnotationJson.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QtMath>

QJsonObject DrawingAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();

    QJsonArray pathsArray;
    for (const DrawingPath& path : paths) {
        QJsonArray pointsArray;
        for (const QPointF& pt : path.points) {
            QJsonObject p;
            p["x"] = pt.x();
            p["y"] = pt.y();
            pointsArray.append(p);
        }
        QJsonObject pathObj;
        pathObj["points"] = pointsArray;
        pathsArray.append(pathObj);
    }
    obj["paths"] = pathsArray;
    obj["color"] = colorToJson(color);
    obj["strokeWidth"] = strokeWidth;
    return obj;
}

void DrawingAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);

    paths.clear();
    const QJsonArray pathsArray = obj["paths"].toArray();
    for (const QJsonValue& pathValue : pathsArray) {
        DrawingPath path;
        const QJsonArray pointsArray = pathValue.toObject()["points"].toArray();
        path.points.reserve(pointsArray.size());
        for (const QJsonValue& pointValue : pointsArray) {
            const QJsonObject p = pointValue.toObject();
            path.points.append(QPointF(p["x"].toDouble(), p["y"].toDouble()));
        }
        paths.append(path);
    }
    color = colorFromJson(obj["color"], Qt::black);
    strokeWidth = obj["strokeWidth"].toDouble(2);
}

bool DrawingAnnotation::validate(QString* errorMessage) const
{
    if (!Annotation::validate(errorMessage)) {
        return false;
    }
    if (paths.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Drawing has no paths");
        }
        return false;
    }
    return true;
}

void DrawingAnnotation::setBoundingRect(const QRectF& rect)
{
    const QRectF old = boundingRect();
    const qreal sx = old.width() > 0 ? rect.width() / old.width() : 1.0;
    const qreal sy = old.height() > 0 ? rect.height() / old.height() : 1.0;

    for (DrawingPath& path : paths) {
        for (QPointF& pt : path.points) {
            pt = QPointF(rect.x() + (pt.x() - old.x()) * sx,
                         rect.y() + (pt.y() - old.y()) * sy);
        }
    }
    Annotation::setBoundingRect(rect);
}

bool DrawingAnnotation::hasPointNear(const QPointF& pt, qreal radius) const
{
    for (const DrawingPath& path : paths) {
        for (const QPointF& p : path.points) {
            if (qSqrt(qPow(p.x() - pt.x(), 2) + qPow(p.y() - pt.y(), 2)) < radius) {
                return true;
            }
        }
    }
    return false;
}

QRectF DrawingAnnotation::boundsOf(const QVector<QPointF>& points)
{
    if (points.isEmpty()) {
        return QRectF(0, 0, 1, 1);
    }

    qreal minX = points.first().x();
    qreal maxX = minX;
    qreal minY = points.first().y();
    qreal maxY = minY;
    for (const QPointF& pt : points) {
        minX = qMin(minX, pt.x());
        maxX = qMax(maxX, pt.x());
        minY = qMin(minY, pt.y());
        maxY = qMax(maxY, pt.y());
    }
    return QRectF(minX, minY, qMax(maxX - minX, 1.0), qMax(maxY - minY, 1.0));
}
