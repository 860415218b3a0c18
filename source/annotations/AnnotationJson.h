#pragma once

// ============================================================================
// AnnotationJson - Small JSON helpers shared by annotation serializers
// ============================================================================

#include <QColor>
#include <QJsonValue>
#include <QString>

/**
 * @brief Colors are stored as "#rrggbb".
 */
inline QString colorToJson(const QColor& color)
{
    return color.name(QColor::HexRgb);
}

inline QColor colorFromJson(const QJsonValue& value, const QColor& fallback)
{
    QColor color(value.toString());
    return color.isValid() ? color : fallback;
}
