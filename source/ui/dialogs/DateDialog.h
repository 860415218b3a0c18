#pragma once

// ============================================================================
// DateDialog - Pick the date and format for a date annotation
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include <QDate>
#include <QDialog>
#include <QString>

class QComboBox;
class QDateEdit;
class QLabel;

class DateDialog : public QDialog
{
    Q_OBJECT

public:
    /**
     * @param format Initially selected pattern (see DateAnnotation::supportedFormats()).
     */
    explicit DateDialog(const QString& format, QWidget* parent = nullptr);

    QDate date() const;
    QString format() const;

private slots:
    void updatePreview();

private:
    QDateEdit* m_dateEdit = nullptr;
    QComboBox* m_formatCombo = nullptr;
    QLabel* m_previewLabel = nullptr;
};
