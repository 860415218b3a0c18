#pragma once

// ============================================================================
// AnnotationType - The closed set of annotation variants
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Consumers that behave differently per variant (render dispatcher, click
// handling) switch over this enum without a default branch, so adding a
// variant produces -Wswitch warnings at every site that must handle it.
// ============================================================================

#include <QString>

enum class AnnotationType {
    Text,
    Drawing,
    Signature,
    Rectangle,
    Line,
    Highlight,
    Image,
    Checkbox,
    Circle,
    Arrow,
    Date,
    Stamp,
    Strikethrough,
    Initials,
    Radio,
    SignedStamp,
    Watermark
};

/**
 * @brief Serialized name of a type ("text", "drawing", "signedStamp", ...).
 */
QString annotationTypeName(AnnotationType type);

/**
 * @brief Parse a serialized type name.
 * @param ok Set to false when the name is not a known type.
 */
AnnotationType annotationTypeFromName(const QString& name, bool* ok);

/**
 * @brief Prefix used when generating ids for a type ("text", "rect", "cb", ...).
 */
QString annotationIdPrefix(AnnotationType type);
