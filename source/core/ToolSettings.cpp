#include "ToolSettings.h"

#include <QSettings>

ToolSettings ToolSettings::load()
{
    ToolSettings s;
    QSettings settings("PdfMarkup", "App");
    settings.beginGroup("tools");

    s.strokeColor = QColor(settings.value("strokeColor", s.strokeColor.name()).toString());
    s.strokeWidth = settings.value("strokeWidth", s.strokeWidth).toReal();
    s.fontSize = settings.value("fontSize", s.fontSize).toReal();
    s.fontFamily = settings.value("fontFamily", s.fontFamily).toString();
    s.highlightColor = QColor(settings.value("highlightColor", s.highlightColor.name()).toString());
    s.redactMode = settings.value("redactMode", s.redactMode).toBool();

    s.stampType = settings.value("stampType", s.stampType).toString();
    s.stampCustomText = settings.value("stampCustomText", s.stampCustomText).toString();
    s.stampShape = stampShapeFromName(settings.value("stampShape", stampShapeName(s.stampShape)).toString());
    s.stampDashed = settings.value("stampDashed", s.stampDashed).toBool();
    s.stampColor = QColor(settings.value("stampColor", s.stampColor.name()).toString());

    s.radioGroup = settings.value("radioGroup", s.radioGroup).toInt();
    s.dateFormat = settings.value("dateFormat", s.dateFormat).toString();

    s.signedStampText = settings.value("signedStampText", s.signedStampText).toString();
    s.signedStampDateFormat = settings.value("signedStampDateFormat", s.signedStampDateFormat).toString();
    s.signedStampColor = QColor(settings.value("signedStampColor", s.signedStampColor.name()).toString());
    s.signedStampShape = stampShapeFromName(
        settings.value("signedStampShape", stampShapeName(s.signedStampShape)).toString());
    s.signedStampStyle = signedStampStyleFromName(
        settings.value("signedStampStyle", signedStampStyleName(s.signedStampStyle)).toString());
    s.signedStampLayout = stampTextLayoutFromName(
        settings.value("signedStampLayout", stampTextLayoutName(s.signedStampLayout)).toString());
    s.signedStampDashed = settings.value("signedStampDashed", s.signedStampDashed).toBool();

    s.watermarkText = settings.value("watermarkText", s.watermarkText).toString();
    s.watermarkColor = QColor(settings.value("watermarkColor", s.watermarkColor.name()).toString());
    s.watermarkOpacity = settings.value("watermarkOpacity", s.watermarkOpacity).toReal();
    s.watermarkRotation = settings.value("watermarkRotation", s.watermarkRotation).toReal();
    s.watermarkFontSize = settings.value("watermarkFontSize", s.watermarkFontSize).toReal();
    s.watermarkBorderStyle = watermarkBorderStyleFromName(
        settings.value("watermarkBorderStyle", watermarkBorderStyleName(s.watermarkBorderStyle)).toString());
    s.watermarkBorderColor = QColor(settings.value("watermarkBorderColor", s.watermarkBorderColor.name()).toString());

    settings.endGroup();

    // Guard against hand-edited config
    if (!s.strokeColor.isValid()) s.strokeColor = Qt::black;
    if (s.strokeWidth <= 0) s.strokeWidth = 2;
    if (s.fontSize <= 0) s.fontSize = 14;
    if (s.radioGroup < 1) s.radioGroup = 1;

    return s;
}

void ToolSettings::save() const
{
    QSettings settings("PdfMarkup", "App");
    settings.beginGroup("tools");

    settings.setValue("strokeColor", strokeColor.name());
    settings.setValue("strokeWidth", strokeWidth);
    settings.setValue("fontSize", fontSize);
    settings.setValue("fontFamily", fontFamily);
    settings.setValue("highlightColor", highlightColor.name());
    settings.setValue("redactMode", redactMode);

    settings.setValue("stampType", stampType);
    settings.setValue("stampCustomText", stampCustomText);
    settings.setValue("stampShape", stampShapeName(stampShape));
    settings.setValue("stampDashed", stampDashed);
    settings.setValue("stampColor", stampColor.name());

    settings.setValue("radioGroup", radioGroup);
    settings.setValue("dateFormat", dateFormat);

    settings.setValue("signedStampText", signedStampText);
    settings.setValue("signedStampDateFormat", signedStampDateFormat);
    settings.setValue("signedStampColor", signedStampColor.name());
    settings.setValue("signedStampShape", stampShapeName(signedStampShape));
    settings.setValue("signedStampStyle", signedStampStyleName(signedStampStyle));
    settings.setValue("signedStampLayout", stampTextLayoutName(signedStampLayout));
    settings.setValue("signedStampDashed", signedStampDashed);

    settings.setValue("watermarkText", watermarkText);
    settings.setValue("watermarkColor", watermarkColor.name());
    settings.setValue("watermarkOpacity", watermarkOpacity);
    settings.setValue("watermarkRotation", watermarkRotation);
    settings.setValue("watermarkFontSize", watermarkFontSize);
    settings.setValue("watermarkBorderStyle", watermarkBorderStyleName(watermarkBorderStyle));
    settings.setValue("watermarkBorderColor", watermarkBorderColor.name());

    settings.endGroup();
}
