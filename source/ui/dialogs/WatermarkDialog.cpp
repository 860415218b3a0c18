#include "WatermarkDialog.h"
#include "../../render/RasterCache.h"

#include <QColorDialog>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QSlider>
#include <QSpinBox>
#include <QStackedWidget>
#include <QVBoxLayout>

WatermarkDialog::WatermarkDialog(const ToolSettings& settings, QWidget* parent)
    : QDialog(parent)
    , m_settings(settings)
{
    setWindowTitle(tr("Watermark"));
    setModal(true);
    setMinimumWidth(340);

    if (settings.watermarkContentType == WatermarkContentType::Image) {
        m_imageData = settings.stagedImageData;
    }

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(20, 20, 20, 20);

    QFormLayout* form = new QFormLayout();

    m_typeCombo = new QComboBox(this);
    m_typeCombo->addItem(tr("Text"));
    m_typeCombo->addItem(tr("Image"));
    m_typeCombo->setCurrentIndex(settings.watermarkContentType == WatermarkContentType::Image ? 1 : 0);
    form->addRow(tr("Content:"), m_typeCombo);

    // Text or image input
    m_contentStack = new QStackedWidget(this);
    m_textEdit = new QLineEdit(settings.watermarkText, m_contentStack);
    m_contentStack->addWidget(m_textEdit);
    m_uploadButton = new QPushButton(m_imageData.isEmpty() ? tr("Choose Image...")
                                                           : tr("Image loaded. Choose another..."),
                                     m_contentStack);
    connect(m_uploadButton, &QPushButton::clicked, this, &WatermarkDialog::onUpload);
    m_contentStack->addWidget(m_uploadButton);
    m_contentStack->setCurrentIndex(m_typeCombo->currentIndex());
    connect(m_typeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            m_contentStack, &QStackedWidget::setCurrentIndex);
    form->addRow(QString(), m_contentStack);

    m_colorButton = new QPushButton(this);
    m_colorButton->setFixedWidth(60);
    paintSwatch(m_colorButton, m_settings.watermarkColor);
    connect(m_colorButton, &QPushButton::clicked, this, [this]() {
        chooseColor(&m_settings.watermarkColor, m_colorButton, tr("Watermark Color"));
    });
    form->addRow(tr("Color:"), m_colorButton);

    QHBoxLayout* opacityLayout = new QHBoxLayout();
    m_opacitySlider = new QSlider(Qt::Horizontal, this);
    m_opacitySlider->setRange(5, 100);
    m_opacitySlider->setValue(qRound(settings.watermarkOpacity * 100));
    QLabel* opacityValue = new QLabel(QString("%1%").arg(m_opacitySlider->value()), this);
    opacityValue->setMinimumWidth(40);
    connect(m_opacitySlider, &QSlider::valueChanged, opacityValue, [opacityValue](int value) {
        opacityValue->setText(QString("%1%").arg(value));
    });
    opacityLayout->addWidget(m_opacitySlider);
    opacityLayout->addWidget(opacityValue);
    form->addRow(tr("Opacity:"), opacityLayout);

    m_rotationSpin = new QSpinBox(this);
    m_rotationSpin->setRange(-180, 180);
    m_rotationSpin->setSuffix(QStringLiteral("°"));
    m_rotationSpin->setValue(qRound(settings.watermarkRotation));
    form->addRow(tr("Rotation:"), m_rotationSpin);

    m_fontSizeSpin = new QDoubleSpinBox(this);
    m_fontSizeSpin->setRange(8, 200);
    m_fontSizeSpin->setDecimals(0);
    m_fontSizeSpin->setValue(settings.watermarkFontSize);
    form->addRow(tr("Font size:"), m_fontSizeSpin);

    m_borderCombo = new QComboBox(this);
    m_borderCombo->addItem(tr("None"), watermarkBorderStyleName(WatermarkBorderStyle::None));
    m_borderCombo->addItem(tr("Solid"), watermarkBorderStyleName(WatermarkBorderStyle::Solid));
    m_borderCombo->addItem(tr("Dashed"), watermarkBorderStyleName(WatermarkBorderStyle::Dashed));
    m_borderCombo->addItem(tr("Dotted"), watermarkBorderStyleName(WatermarkBorderStyle::Dotted));
    const int borderIndex = m_borderCombo->findData(watermarkBorderStyleName(settings.watermarkBorderStyle));
    m_borderCombo->setCurrentIndex(borderIndex >= 0 ? borderIndex : 0);
    form->addRow(tr("Border:"), m_borderCombo);

    m_borderColorButton = new QPushButton(this);
    m_borderColorButton->setFixedWidth(60);
    paintSwatch(m_borderColorButton, m_settings.watermarkBorderColor);
    connect(m_borderColorButton, &QPushButton::clicked, this, [this]() {
        chooseColor(&m_settings.watermarkBorderColor, m_borderColorButton, tr("Border Color"));
    });
    form->addRow(tr("Border color:"), m_borderColorButton);

    mainLayout->addLayout(form);

    QHBoxLayout* buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();

    QPushButton* cancelButton = new QPushButton(tr("Cancel"), this);
    cancelButton->setMinimumWidth(80);
    connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    buttonLayout->addWidget(cancelButton);

    QPushButton* placeButton = new QPushButton(tr("Place Watermark"), this);
    placeButton->setMinimumWidth(80);
    placeButton->setDefault(true);
    connect(placeButton, &QPushButton::clicked, this, &WatermarkDialog::onAccept);
    buttonLayout->addWidget(placeButton);

    mainLayout->addLayout(buttonLayout);
}

ToolSettings WatermarkDialog::settings() const
{
    ToolSettings s = m_settings;
    s.watermarkContentType = m_typeCombo->currentIndex() == 1 ? WatermarkContentType::Image
                                                               : WatermarkContentType::Text;
    s.watermarkText = m_textEdit->text();
    if (s.watermarkContentType == WatermarkContentType::Image) {
        s.stagedImageData = m_imageData;
    }
    s.watermarkOpacity = m_opacitySlider->value() / 100.0;
    s.watermarkRotation = m_rotationSpin->value();
    s.watermarkFontSize = m_fontSizeSpin->value();
    s.watermarkBorderStyle = watermarkBorderStyleFromName(m_borderCombo->currentData().toString());
    return s;
}

void WatermarkDialog::onAccept()
{
    const bool image = m_typeCombo->currentIndex() == 1;
    if (image ? m_imageData.isEmpty() : m_textEdit->text().isEmpty()) {
        QMessageBox::warning(this, windowTitle(),
                             image ? tr("Please upload an image") : tr("Please enter watermark text"));
        return;
    }
    accept();
}

void WatermarkDialog::onUpload()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Watermark Image"), QString(),
                                                      tr("Images (*.png *.jpg *.jpeg *.bmp *.gif *.webp)"));
    if (path.isEmpty()) {
        return;
    }

    const QString data = RasterCache::encodeImageFile(path);
    if (data.isEmpty()) {
        QMessageBox::warning(this, windowTitle(), tr("Please upload an image file"));
        return;
    }
    m_imageData = data;
    m_uploadButton->setText(tr("Image loaded. Choose another..."));
}

void WatermarkDialog::chooseColor(QColor* target, QPushButton* button, const QString& title)
{
    const QColor color = QColorDialog::getColor(*target, this, title);
    if (!color.isValid()) {
        return;
    }
    *target = color;
    paintSwatch(button, color);
}

void WatermarkDialog::paintSwatch(QPushButton* button, const QColor& color)
{
    button->setStyleSheet(QString("background-color: %1;").arg(color.name()));
}
