#pragma once

// ============================================================================
// WatermarkDialog - Configure a text or image watermark before placing it
// ============================================================================
// Part of the PdfMarkup annotation engine
// ============================================================================

#include "../../core/ToolSettings.h"

#include <QDialog>

class QComboBox;
class QDoubleSpinBox;
class QLineEdit;
class QPushButton;
class QSlider;
class QSpinBox;
class QStackedWidget;

class WatermarkDialog : public QDialog
{
    Q_OBJECT

public:
    explicit WatermarkDialog(const ToolSettings& settings, QWidget* parent = nullptr);

    /**
     * @brief The input settings with the watermark fields replaced.
     *
     * For image watermarks the uploaded image is in stagedImageData.
     */
    ToolSettings settings() const;

private slots:
    void onAccept();
    void onUpload();

private:
    void chooseColor(QColor* target, QPushButton* button, const QString& title);
    static void paintSwatch(QPushButton* button, const QColor& color);

    ToolSettings m_settings;
    QString m_imageData;

    QComboBox* m_typeCombo = nullptr;
    QStackedWidget* m_contentStack = nullptr;
    QLineEdit* m_textEdit = nullptr;
    QPushButton* m_uploadButton = nullptr;
    QPushButton* m_colorButton = nullptr;
    QSlider* m_opacitySlider = nullptr;
    QSpinBox* m_rotationSpin = nullptr;
    QDoubleSpinBox* m_fontSizeSpin = nullptr;
    QComboBox* m_borderCombo = nullptr;
    QPushButton* m_borderColorButton = nullptr;
};
