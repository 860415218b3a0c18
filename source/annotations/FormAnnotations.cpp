#include "FormAnnotations.h"

#include <QCoreApplication>

QJsonObject CheckboxAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["checked"] = checked;
    return obj;
}

void CheckboxAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    checked = obj["checked"].toBool(false);
}

QJsonObject RadioAnnotation::toJson() const
{
    QJsonObject obj = Annotation::toJson();
    obj["checked"] = checked;
    obj["groupId"] = groupId;
    return obj;
}

void RadioAnnotation::loadFromJson(const QJsonObject& obj)
{
    Annotation::loadFromJson(obj);
    checked = obj["checked"].toBool(false);
    groupId = obj["groupId"].toString();
}

bool RadioAnnotation::validate(QString* errorMessage) const
{
    if (!Annotation::validate(errorMessage)) {
        return false;
    }
    if (groupId.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("Annotation", "Radio button has no group");
        }
        return false;
    }
    return true;
}
