#include "DateDialog.h"
#include "../../annotations/TextAnnotations.h"

#include <QComboBox>
#include <QDateEdit>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

DateDialog::DateDialog(const QString& format, QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Insert Date"));
    setModal(true);
    setMinimumWidth(300);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(20, 20, 20, 20);

    QFormLayout* form = new QFormLayout();

    m_dateEdit = new QDateEdit(QDate::currentDate(), this);
    m_dateEdit->setCalendarPopup(true);
    form->addRow(tr("Date:"), m_dateEdit);

    m_formatCombo = new QComboBox(this);
    m_formatCombo->addItems(DateAnnotation::supportedFormats());
    const int index = m_formatCombo->findText(format);
    m_formatCombo->setCurrentIndex(index >= 0 ? index : 0);
    form->addRow(tr("Format:"), m_formatCombo);

    m_previewLabel = new QLabel(this);
    m_previewLabel->setStyleSheet("font-weight: bold;");
    form->addRow(tr("Preview:"), m_previewLabel);

    mainLayout->addLayout(form);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Ok)->setText(tr("Place Date"));
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);

    connect(m_dateEdit, &QDateEdit::dateChanged, this, &DateDialog::updatePreview);
    connect(m_formatCombo, &QComboBox::currentTextChanged, this, &DateDialog::updatePreview);
    updatePreview();
}

QDate DateDialog::date() const
{
    return m_dateEdit->date();
}

QString DateDialog::format() const
{
    return m_formatCombo->currentText();
}

void DateDialog::updatePreview()
{
    m_previewLabel->setText(DateAnnotation::formatDate(date(), format()));
}
