#pragma once

// ============================================================================
// SignedStampDialog - Configure a signed stamp before placing it
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Edits the signed-stamp fields of ToolSettings (heading, shape, style,
// text layout, color, border, date format) and collects the signature,
// drawn on a pad or uploaded as an image.
// ============================================================================

#include "../../core/ToolSettings.h"

#include <QDate>
#include <QDialog>
#include <QString>

class QCheckBox;
class QComboBox;
class QDateEdit;
class QLineEdit;
class QPushButton;
class QStackedWidget;
class SignaturePad;

class SignedStampDialog : public QDialog
{
    Q_OBJECT

public:
    explicit SignedStampDialog(const ToolSettings& settings, QWidget* parent = nullptr);

    /**
     * @brief The input settings with the signed-stamp fields replaced.
     */
    ToolSettings settings() const;

    QString signatureData() const { return m_signatureData; }
    QDate date() const;

private slots:
    void onAccept();
    void onUpload();
    void onChooseColor();

private:
    void updateColorButton();

    ToolSettings m_settings;
    QString m_signatureData;
    QString m_uploadedData;

    QLineEdit* m_textEdit = nullptr;
    QComboBox* m_shapeCombo = nullptr;
    QComboBox* m_styleCombo = nullptr;
    QComboBox* m_layoutCombo = nullptr;
    QCheckBox* m_dashedCheck = nullptr;
    QPushButton* m_colorButton = nullptr;
    QDateEdit* m_dateEdit = nullptr;
    QComboBox* m_dateFormatCombo = nullptr;
    QComboBox* m_signatureModeCombo = nullptr;
    QStackedWidget* m_signatureStack = nullptr;
    SignaturePad* m_pad = nullptr;
    QPushButton* m_uploadButton = nullptr;
};
