#pragma once

// ============================================================================
// SignatureDialog - Capture a signature or initials
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// The user either draws on a SignaturePad or uploads an image file. The
// result is a PNG data URL ready for SignatureAnnotation / InitialsAnnotation.
// ============================================================================

#include <QDialog>
#include <QString>

class QPushButton;
class SignaturePad;

class SignatureDialog : public QDialog
{
    Q_OBJECT

public:
    enum class Kind { Signature, Initials };

    explicit SignatureDialog(Kind kind, QWidget* parent = nullptr);

    /**
     * @brief Captured payload; empty until the dialog is accepted.
     */
    QString dataUrl() const { return m_dataUrl; }

private slots:
    void onSave();
    void onUpload();
    void updateButtons();

private:
    Kind m_kind;
    QString m_dataUrl;

    SignaturePad* m_pad = nullptr;
    QPushButton* m_undoButton = nullptr;
    QPushButton* m_clearButton = nullptr;
    QPushButton* m_saveButton = nullptr;
};
