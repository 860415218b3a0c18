#include "SignatureDialog.h"
#include "../SignaturePad.h"
#include "../../render/RasterCache.h"

#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>

SignatureDialog::SignatureDialog(Kind kind, QWidget* parent)
    : QDialog(parent)
    , m_kind(kind)
{
    setWindowTitle(kind == Kind::Signature ? tr("Add Your Signature") : tr("Add Your Initials"));
    setModal(true);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(20, 20, 20, 20);

    QLabel* hint = new QLabel(kind == Kind::Signature
                                  ? tr("Draw your signature below or upload an image.")
                                  : tr("Draw your initials below or upload an image."),
                              this);
    mainLayout->addWidget(hint);

    m_pad = new SignaturePad(this);
    mainLayout->addWidget(m_pad, 0, Qt::AlignHCenter);
    connect(m_pad, &SignaturePad::changed, this, &SignatureDialog::updateButtons);

    // Pad controls
    QHBoxLayout* padLayout = new QHBoxLayout();
    m_undoButton = new QPushButton(tr("Undo"), this);
    connect(m_undoButton, &QPushButton::clicked, m_pad, &SignaturePad::undo);
    padLayout->addWidget(m_undoButton);

    m_clearButton = new QPushButton(tr("Clear"), this);
    connect(m_clearButton, &QPushButton::clicked, m_pad, &SignaturePad::clear);
    padLayout->addWidget(m_clearButton);

    padLayout->addStretch();

    QPushButton* uploadButton = new QPushButton(tr("Upload Image..."), this);
    connect(uploadButton, &QPushButton::clicked, this, &SignatureDialog::onUpload);
    padLayout->addWidget(uploadButton);
    mainLayout->addLayout(padLayout);

    // Dialog buttons
    QHBoxLayout* buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();

    QPushButton* cancelButton = new QPushButton(tr("Cancel"), this);
    cancelButton->setMinimumWidth(80);
    connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    buttonLayout->addWidget(cancelButton);

    m_saveButton = new QPushButton(tr("Save"), this);
    m_saveButton->setMinimumWidth(80);
    m_saveButton->setDefault(true);
    connect(m_saveButton, &QPushButton::clicked, this, &SignatureDialog::onSave);
    buttonLayout->addWidget(m_saveButton);

    mainLayout->addLayout(buttonLayout);

    updateButtons();
}

void SignatureDialog::onSave()
{
    if (m_pad->isEmpty()) {
        return;
    }
    m_dataUrl = RasterCache::encodeDataUrl(m_pad->toImage());
    if (m_dataUrl.isEmpty()) {
        QMessageBox::warning(this, windowTitle(), tr("Could not encode the drawing."));
        return;
    }
    accept();
}

void SignatureDialog::onUpload()
{
    const QString path = QFileDialog::getOpenFileName(this,
        m_kind == Kind::Signature ? tr("Upload Signature") : tr("Upload Initials"),
        QString(),
        tr("Images (*.png *.jpg *.jpeg *.bmp *.gif *.webp)"));
    if (path.isEmpty()) {
        return;
    }

    const QString data = RasterCache::encodeImageFile(path);
    if (data.isEmpty()) {
        QMessageBox::warning(this, windowTitle(), tr("Please upload an image file"));
        return;
    }
    m_dataUrl = data;
    accept();
}

void SignatureDialog::updateButtons()
{
    const bool hasInk = !m_pad->isEmpty();
    m_undoButton->setEnabled(hasInk);
    m_clearButton->setEnabled(hasInk);
    m_saveButton->setEnabled(hasInk);
}
