#include "SignedStampDialog.h"
#include "../SignaturePad.h"
#include "../../annotations/TextAnnotations.h"
#include "../../render/RasterCache.h"

#include <QCheckBox>
#include <QColorDialog>
#include <QComboBox>
#include <QDateEdit>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QStackedWidget>
#include <QVBoxLayout>

namespace {

enum SignatureMode { DrawMode, UploadMode };

void selectData(QComboBox* combo, const QString& value)
{
    const int index = combo->findData(value);
    if (index >= 0) {
        combo->setCurrentIndex(index);
    }
}

} // namespace

SignedStampDialog::SignedStampDialog(const ToolSettings& settings, QWidget* parent)
    : QDialog(parent)
    , m_settings(settings)
{
    setWindowTitle(tr("Signed Stamp"));
    setModal(true);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(20, 20, 20, 20);

    QFormLayout* form = new QFormLayout();

    m_textEdit = new QLineEdit(settings.signedStampText, this);
    form->addRow(tr("Stamp text:"), m_textEdit);

    m_shapeCombo = new QComboBox(this);
    m_shapeCombo->addItem(tr("Circle"), stampShapeName(StampShape::Circle));
    m_shapeCombo->addItem(tr("Box"), stampShapeName(StampShape::Box));
    selectData(m_shapeCombo, stampShapeName(settings.signedStampShape));
    form->addRow(tr("Shape:"), m_shapeCombo);

    m_styleCombo = new QComboBox(this);
    m_styleCombo->addItem(tr("Modern"), signedStampStyleName(SignedStampStyle::Modern));
    m_styleCombo->addItem(tr("Classic"), signedStampStyleName(SignedStampStyle::Classic));
    m_styleCombo->addItem(tr("Official"), signedStampStyleName(SignedStampStyle::Official));
    selectData(m_styleCombo, signedStampStyleName(settings.signedStampStyle));
    form->addRow(tr("Style:"), m_styleCombo);

    m_layoutCombo = new QComboBox(this);
    m_layoutCombo->addItem(tr("Curved"), stampTextLayoutName(StampTextLayout::Curved));
    m_layoutCombo->addItem(tr("Straight"), stampTextLayoutName(StampTextLayout::Straight));
    selectData(m_layoutCombo, stampTextLayoutName(settings.signedStampLayout));
    form->addRow(tr("Text layout:"), m_layoutCombo);

    QHBoxLayout* borderLayout = new QHBoxLayout();
    m_colorButton = new QPushButton(this);
    m_colorButton->setFixedWidth(60);
    connect(m_colorButton, &QPushButton::clicked, this, &SignedStampDialog::onChooseColor);
    borderLayout->addWidget(m_colorButton);
    m_dashedCheck = new QCheckBox(tr("Dashed border"), this);
    m_dashedCheck->setChecked(settings.signedStampDashed);
    borderLayout->addWidget(m_dashedCheck);
    borderLayout->addStretch();
    form->addRow(tr("Color:"), borderLayout);

    m_dateEdit = new QDateEdit(QDate::currentDate(), this);
    m_dateEdit->setCalendarPopup(true);
    form->addRow(tr("Date:"), m_dateEdit);

    m_dateFormatCombo = new QComboBox(this);
    m_dateFormatCombo->addItems(DateAnnotation::supportedFormats());
    const int formatIndex = m_dateFormatCombo->findText(settings.signedStampDateFormat);
    m_dateFormatCombo->setCurrentIndex(formatIndex >= 0 ? formatIndex : 0);
    form->addRow(tr("Date format:"), m_dateFormatCombo);

    m_signatureModeCombo = new QComboBox(this);
    m_signatureModeCombo->addItem(tr("Draw"));
    m_signatureModeCombo->addItem(tr("Upload"));
    form->addRow(tr("Signature:"), m_signatureModeCombo);

    mainLayout->addLayout(form);

    // Signature input: pad or upload button
    m_signatureStack = new QStackedWidget(this);

    QWidget* drawPage = new QWidget(m_signatureStack);
    QVBoxLayout* drawLayout = new QVBoxLayout(drawPage);
    drawLayout->setContentsMargins(0, 0, 0, 0);
    m_pad = new SignaturePad(drawPage);
    drawLayout->addWidget(m_pad, 0, Qt::AlignHCenter);
    QPushButton* clearButton = new QPushButton(tr("Clear"), drawPage);
    connect(clearButton, &QPushButton::clicked, m_pad, &SignaturePad::clear);
    drawLayout->addWidget(clearButton, 0, Qt::AlignRight);
    m_signatureStack->addWidget(drawPage);

    QWidget* uploadPage = new QWidget(m_signatureStack);
    QVBoxLayout* uploadLayout = new QVBoxLayout(uploadPage);
    uploadLayout->setContentsMargins(0, 0, 0, 0);
    m_uploadButton = new QPushButton(tr("Choose Image..."), uploadPage);
    m_uploadButton->setMinimumHeight(40);
    connect(m_uploadButton, &QPushButton::clicked, this, &SignedStampDialog::onUpload);
    uploadLayout->addWidget(m_uploadButton);
    uploadLayout->addStretch();
    m_signatureStack->addWidget(uploadPage);

    connect(m_signatureModeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            m_signatureStack, &QStackedWidget::setCurrentIndex);
    mainLayout->addWidget(m_signatureStack);

    // Buttons
    QHBoxLayout* buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();

    QPushButton* cancelButton = new QPushButton(tr("Cancel"), this);
    cancelButton->setMinimumWidth(80);
    connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    buttonLayout->addWidget(cancelButton);

    QPushButton* placeButton = new QPushButton(tr("Place Stamp"), this);
    placeButton->setMinimumWidth(80);
    placeButton->setDefault(true);
    connect(placeButton, &QPushButton::clicked, this, &SignedStampDialog::onAccept);
    buttonLayout->addWidget(placeButton);

    mainLayout->addLayout(buttonLayout);

    updateColorButton();
}

ToolSettings SignedStampDialog::settings() const
{
    ToolSettings s = m_settings;
    s.signedStampText = m_textEdit->text();
    s.signedStampShape = stampShapeFromName(m_shapeCombo->currentData().toString());
    s.signedStampStyle = signedStampStyleFromName(m_styleCombo->currentData().toString());
    s.signedStampLayout = stampTextLayoutFromName(m_layoutCombo->currentData().toString());
    s.signedStampDashed = m_dashedCheck->isChecked();
    s.signedStampDateFormat = m_dateFormatCombo->currentText();
    return s;
}

QDate SignedStampDialog::date() const
{
    return m_dateEdit->date();
}

void SignedStampDialog::onAccept()
{
    if (m_signatureModeCombo->currentIndex() == DrawMode) {
        m_signatureData = m_pad->isEmpty() ? QString() : RasterCache::encodeDataUrl(m_pad->toImage());
    } else {
        m_signatureData = m_uploadedData;
    }

    if (m_signatureData.isEmpty()) {
        QMessageBox::warning(this, windowTitle(), tr("Please draw or upload a signature"));
        return;
    }
    accept();
}

void SignedStampDialog::onUpload()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Upload Signature"), QString(),
                                                      tr("Images (*.png *.jpg *.jpeg *.bmp *.gif *.webp)"));
    if (path.isEmpty()) {
        return;
    }

    const QString data = RasterCache::encodeImageFile(path);
    if (data.isEmpty()) {
        QMessageBox::warning(this, windowTitle(), tr("Please upload an image file"));
        return;
    }
    m_uploadedData = data;
    m_uploadButton->setText(tr("Signature loaded. Choose another..."));
}

void SignedStampDialog::onChooseColor()
{
    const QColor color = QColorDialog::getColor(m_settings.signedStampColor, this, tr("Stamp Color"));
    if (!color.isValid()) {
        return;
    }
    m_settings.signedStampColor = color;
    updateColorButton();
}

void SignedStampDialog::updateColorButton()
{
    m_colorButton->setStyleSheet(QString("background-color: %1;").arg(m_settings.signedStampColor.name()));
}
