#pragma once

// ============================================================================
// ToolType - Available annotation tools
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include <QString>

/**
 * @brief Tools selectable in the editor toolbar.
 *
 * Select and Eraser operate on existing annotations; every other tool
 * creates one annotation variant.
 */
enum class ToolType {
    Select,         ///< Pick, move and resize annotations
    Text,           ///< Click to type free text
    Draw,           ///< Freehand ink
    Signature,      ///< Place captured signature (one-shot)
    Rectangle,      ///< Drag to define
    Line,           ///< Drag to define
    Highlight,      ///< Drag to define
    Eraser,         ///< Remove drawings under the pointer
    Image,          ///< Place staged image (one-shot)
    Checkbox,       ///< Click to place
    Circle,         ///< Drag to define
    Arrow,          ///< Drag to define
    Date,           ///< Click, then confirm format (modal)
    Stamp,          ///< Place rubber stamp (one-shot)
    Strikethrough,  ///< Drag to define
    Initials,       ///< Place captured initials (one-shot)
    Radio,          ///< Click to place
    SignedStamp,    ///< Click, then confirm signed stamp (modal, one-shot)
    Watermark       ///< Click, then confirm watermark (modal, one-shot)
};

inline QString toolTypeName(ToolType tool)
{
    switch (tool) {
        case ToolType::Select:        return QStringLiteral("select");
        case ToolType::Text:          return QStringLiteral("text");
        case ToolType::Draw:          return QStringLiteral("draw");
        case ToolType::Signature:     return QStringLiteral("signature");
        case ToolType::Rectangle:     return QStringLiteral("rectangle");
        case ToolType::Line:          return QStringLiteral("line");
        case ToolType::Highlight:     return QStringLiteral("highlight");
        case ToolType::Eraser:        return QStringLiteral("eraser");
        case ToolType::Image:         return QStringLiteral("image");
        case ToolType::Checkbox:      return QStringLiteral("checkbox");
        case ToolType::Circle:        return QStringLiteral("circle");
        case ToolType::Arrow:         return QStringLiteral("arrow");
        case ToolType::Date:          return QStringLiteral("date");
        case ToolType::Stamp:         return QStringLiteral("stamp");
        case ToolType::Strikethrough: return QStringLiteral("strikethrough");
        case ToolType::Initials:      return QStringLiteral("initials");
        case ToolType::Radio:         return QStringLiteral("radio");
        case ToolType::SignedStamp:   return QStringLiteral("signedStamp");
        case ToolType::Watermark:     return QStringLiteral("watermark");
    }
    return QString();
}

/**
 * @brief Tools that switch back to Select after placing one annotation.
 */
inline bool isOneShotTool(ToolType tool)
{
    switch (tool) {
        case ToolType::Signature:
        case ToolType::Initials:
        case ToolType::Stamp:
        case ToolType::Image:
        case ToolType::SignedStamp:
        case ToolType::Watermark:
            return true;
        default:
            return false;
    }
}
