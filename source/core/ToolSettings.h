#pragma once

// ============================================================================
// ToolSettings - Style defaults applied to newly created annotations
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Values are persisted under the "tools/" group of QSettings("PdfMarkup",
// "App"). Staged payloads (captured signature, uploaded image) are
// session-only and never written to disk.
// ============================================================================

#include "../annotations/StampAnnotations.h"

#include <QColor>
#include <QSizeF>
#include <QString>

struct ToolSettings {
    // ===== Stroke / Text =====
    QColor strokeColor = Qt::black;
    qreal strokeWidth = 2;
    qreal fontSize = 14;
    QString fontFamily = QStringLiteral("Helvetica");
    QColor highlightColor = QColor(0xFF, 0xFF, 0x00);
    bool redactMode = false;     ///< Strikethrough tool draws redaction boxes

    // ===== Stamp =====
    QString stampType = QStringLiteral("approved");
    QString stampCustomText = QStringLiteral("CUSTOM");
    StampShape stampShape = StampShape::Box;
    bool stampDashed = false;
    QColor stampColor = QColor(0x16, 0xa3, 0x4a);

    // ===== Form / Date =====
    int radioGroup = 1;
    QString dateFormat = QStringLiteral("MM/DD/YYYY");

    // ===== Signed Stamp =====
    QString signedStampText = QStringLiteral("APPROVED BY");
    QString signedStampDateFormat = QStringLiteral("MMM DD, YYYY");
    QColor signedStampColor = QColor(0x1e, 0x40, 0xaf);
    StampShape signedStampShape = StampShape::Circle;
    SignedStampStyle signedStampStyle = SignedStampStyle::Classic;
    StampTextLayout signedStampLayout = StampTextLayout::Curved;
    bool signedStampDashed = false;

    // ===== Watermark =====
    QString watermarkText = QStringLiteral("CONFIDENTIAL");
    WatermarkContentType watermarkContentType = WatermarkContentType::Text;
    QColor watermarkColor = QColor(0x6b, 0x72, 0x80);
    qreal watermarkOpacity = 0.3;
    qreal watermarkRotation = -45;
    qreal watermarkFontSize = 48;
    WatermarkBorderStyle watermarkBorderStyle = WatermarkBorderStyle::None;
    QColor watermarkBorderColor = QColor(0x6b, 0x72, 0x80);

    // ===== Staged payloads (not persisted) =====
    QString signatureData;       ///< Captured signature data URL
    QString initialsData;        ///< Captured initials data URL
    QString stagedImageData;     ///< Uploaded image data URL, placed at the next click
    QSizeF stagedImageSize;      ///< Natural size of the staged image

    /**
     * @brief Load persisted values; missing keys keep their defaults.
     */
    static ToolSettings load();

    /**
     * @brief Persist everything except staged payloads.
     */
    void save() const;
};
