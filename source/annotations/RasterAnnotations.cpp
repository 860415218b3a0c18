#include "RasterAnnotations.h"

#include <QCoreApplication>

QJsonObject RasterAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["data"] = data;
    return obj;
}

void RasterAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    data = obj["data"].toString();
}

bool RasterAnnotation::validate(QString* errorMessage) const
{
    if (!Annotation::validate(errorMessage)) {
        return false;
    }
    if (data.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "%1 has no image data").arg(typeName());
        }
        return false;
    }
    return true;
}
