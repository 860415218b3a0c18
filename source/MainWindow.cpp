#include "MainWindow.h"

#include "core/AnnotationToolController.h"
#include "core/MarkupCanvas.h"
#include "core/ShortcutManager.h"
#include "core/ViewportController.h"
#include "pdf/MuPdfFlattener.h"
#include "pdf/PdfFlattener.h"
#include "render/RasterCache.h"
#include "ui/dialogs/DateDialog.h"
#include "ui/dialogs/SignatureDialog.h"
#include "ui/dialogs/SignedStampDialog.h"
#include "ui/dialogs/WatermarkDialog.h"

#include <QAction>
#include <QActionGroup>
#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QColorDialog>
#include <QComboBox>
#include <QDebug>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QLabel>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QResizeEvent>
#include <QSaveFile>
#include <QScrollArea>
#include <QSettings>
#include <QSpinBox>
#include <QStatusBar>
#include <QToolBar>

namespace {

struct ToolEntry {
    ToolType tool;
    const char* label;
    const char* shortcutAction;   ///< ShortcutManager id shown in the tooltip
};

const ToolEntry TOOL_ENTRIES[] = {
    { ToolType::Select,        QT_TRANSLATE_NOOP("MainWindow", "Select"),    "tool.select" },
    { ToolType::Text,          QT_TRANSLATE_NOOP("MainWindow", "Text"),      "tool.text" },
    { ToolType::Draw,          QT_TRANSLATE_NOOP("MainWindow", "Draw"),      "tool.draw" },
    { ToolType::Signature,     QT_TRANSLATE_NOOP("MainWindow", "Sign"),      "tool.signature" },
    { ToolType::Initials,      QT_TRANSLATE_NOOP("MainWindow", "Initials"),  nullptr },
    { ToolType::Date,          QT_TRANSLATE_NOOP("MainWindow", "Date"),      nullptr },
    { ToolType::Stamp,         QT_TRANSLATE_NOOP("MainWindow", "Stamp"),     nullptr },
    { ToolType::SignedStamp,   QT_TRANSLATE_NOOP("MainWindow", "Signed"),    nullptr },
    { ToolType::Watermark,     QT_TRANSLATE_NOOP("MainWindow", "Watermark"), nullptr },
    { ToolType::Rectangle,     QT_TRANSLATE_NOOP("MainWindow", "Rectangle"), "tool.rectangle" },
    { ToolType::Circle,        QT_TRANSLATE_NOOP("MainWindow", "Circle"),    "tool.circle" },
    { ToolType::Line,          QT_TRANSLATE_NOOP("MainWindow", "Line"),      nullptr },
    { ToolType::Arrow,         QT_TRANSLATE_NOOP("MainWindow", "Arrow"),     "tool.arrow" },
    { ToolType::Highlight,     QT_TRANSLATE_NOOP("MainWindow", "Highlight"), "tool.highlight" },
    { ToolType::Strikethrough, QT_TRANSLATE_NOOP("MainWindow", "Strike"),    nullptr },
    { ToolType::Checkbox,      QT_TRANSLATE_NOOP("MainWindow", "Checkbox"),  nullptr },
    { ToolType::Radio,         QT_TRANSLATE_NOOP("MainWindow", "Radio"),     nullptr },
    { ToolType::Image,         QT_TRANSLATE_NOOP("MainWindow", "Image"),     nullptr },
    { ToolType::Eraser,        QT_TRANSLATE_NOOP("MainWindow", "Eraser"),    nullptr },
};

const char* const IMAGE_FILTER = QT_TRANSLATE_NOOP("MainWindow", "Images (*.png *.jpg *.jpeg *.bmp *.gif *.webp)");

} // namespace

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("PdfMarkup"));
    resize(1200, 900);

    m_viewport = new ViewportController(&m_environment, this);
    m_controller = new AnnotationToolController(0, this);
    m_controller->setSettings(ToolSettings::load());
    m_rasterCache = new RasterCache(this);
    m_flattener = new MuPdfFlattener(this);

    setupUi();
    connectSession();

    QSettings settings("PdfMarkup", "App");
    restoreGeometry(settings.value("window/geometry").toByteArray());
    m_environment.setWindowWidth(width());

    updateEditActions();
    onToolChanged(m_controller->activeTool());
    showMessage(tr("Open a PDF to start annotating."), 0);
}

MainWindow::~MainWindow() = default;

// ============================================================================
// UI Setup
// ============================================================================

void MainWindow::setupUi()
{
    m_scrollArea = new QScrollArea(this);
    m_scrollArea->setAlignment(Qt::AlignCenter);
    m_scrollArea->setBackgroundRole(QPalette::Dark);
    m_scrollArea->setWidgetResizable(false);

    m_canvas = new MarkupCanvas(m_viewport, m_controller, m_rasterCache);
    m_scrollArea->setWidget(m_canvas);
    setCentralWidget(m_scrollArea);

    setupMenus();
    setupToolBar();
    setupStyleBar();
    statusBar();
}

void MainWindow::setupMenus()
{
    ShortcutManager* sm = ShortcutManager::instance();

    // Shortcuts are dispatched by the canvas; menus only display them
    auto hint = [sm](QAction* action, const char* actionId) {
        action->setToolTip(QString("%1 (%2)").arg(action->text(), sm->shortcutForAction(actionId)));
    };

    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    QAction* openAction = fileMenu->addAction(tr("Open PDF..."), this, &MainWindow::showOpenDialog);
    hint(openAction, "file.open");
    m_exportAction = fileMenu->addAction(tr("Export Filled PDF..."), this, &MainWindow::exportPdf);
    hint(m_exportAction, "file.export");
    fileMenu->addSeparator();
    fileMenu->addAction(tr("Quit"), this, &QWidget::close);

    QMenu* editMenu = menuBar()->addMenu(tr("&Edit"));
    m_undoAction = editMenu->addAction(tr("Undo"), m_controller, &AnnotationToolController::undo);
    hint(m_undoAction, "edit.undo");
    m_redoAction = editMenu->addAction(tr("Redo"), m_controller, &AnnotationToolController::redo);
    hint(m_redoAction, "edit.redo");
    m_deleteAction = editMenu->addAction(tr("Delete"), m_controller, &AnnotationToolController::deleteSelected);
    hint(m_deleteAction, "edit.delete");
    editMenu->addSeparator();
    m_revertAction = editMenu->addAction(tr("Revert All Changes"), this, [this]() {
        if (m_controller->annotations().isEmpty()) {
            return;
        }
        if (QMessageBox::question(this, tr("Revert All Changes"),
                                  tr("Remove every annotation? This cannot be undone."))
            == QMessageBox::Yes) {
            m_controller->revertAll();
        }
    });
    editMenu->addSeparator();
    editMenu->addAction(tr("Signature..."), this, &MainWindow::editSignature);
    editMenu->addAction(tr("Initials..."), this, &MainWindow::editInitials);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    QAction* zoomIn = viewMenu->addAction(tr("Zoom In"), m_viewport, &ViewportController::zoomIn);
    hint(zoomIn, "zoom.in");
    QAction* zoomOut = viewMenu->addAction(tr("Zoom Out"), m_viewport, &ViewportController::zoomOut);
    hint(zoomOut, "zoom.out");
    QAction* zoomReset = viewMenu->addAction(tr("Reset Zoom"), m_viewport, &ViewportController::resetZoom);
    hint(zoomReset, "zoom.reset");
    QAction* fitWidth = viewMenu->addAction(tr("Fit to Width"), this, [this]() {
        m_viewport->fitToWidth(m_scrollArea->viewport()->width());
    });
    hint(fitWidth, "zoom.fit_width");
    viewMenu->addSeparator();
    m_prevPageAction = viewMenu->addAction(tr("Previous Page"), m_viewport, &ViewportController::previousPage);
    hint(m_prevPageAction, "navigation.prev_page");
    m_nextPageAction = viewMenu->addAction(tr("Next Page"), m_viewport, &ViewportController::nextPage);
    hint(m_nextPageAction, "navigation.next_page");
}

void MainWindow::setupToolBar()
{
    ShortcutManager* sm = ShortcutManager::instance();

    QToolBar* toolBar = addToolBar(tr("Tools"));
    toolBar->setObjectName("ToolsToolBar");
    toolBar->setMovable(false);

    m_toolGroup = new QActionGroup(this);
    m_toolGroup->setExclusive(true);

    for (const ToolEntry& entry : TOOL_ENTRIES) {
        QAction* action = toolBar->addAction(tr(entry.label));
        action->setCheckable(true);
        if (entry.shortcutAction) {
            action->setToolTip(QString("%1 (%2)").arg(action->text(), sm->shortcutForAction(entry.shortcutAction)));
        }
        m_toolGroup->addAction(action);
        m_toolActions.insert(entry.tool, action);

        const ToolType tool = entry.tool;
        if (tool == ToolType::Image) {
            // Uploads immediately and places at a fixed spot
            connect(action, &QAction::triggered, this, &MainWindow::insertImage);
        } else {
            connect(action, &QAction::triggered, this, [this, tool]() {
                m_controller->setActiveTool(tool);
            });
        }
    }

    QToolBar* navBar = addToolBar(tr("Navigation"));
    navBar->setObjectName("NavigationToolBar");
    navBar->setMovable(false);

    navBar->addAction(m_prevPageAction);
    m_pageSpin = new QSpinBox(navBar);
    m_pageSpin->setRange(1, 1);
    m_pageSpin->setEnabled(false);
    connect(m_pageSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, [this](int page) {
        m_viewport->setCurrentPage(page);
    });
    navBar->addWidget(m_pageSpin);
    m_pageCountLabel = new QLabel(tr("of %1").arg(0), navBar);
    navBar->addWidget(m_pageCountLabel);
    navBar->addAction(m_nextPageAction);
    navBar->addSeparator();

    navBar->addAction(tr("-"), m_viewport, &ViewportController::zoomOut);
    m_zoomLabel = new QLabel(navBar);
    m_zoomLabel->setMinimumWidth(48);
    m_zoomLabel->setAlignment(Qt::AlignCenter);
    navBar->addWidget(m_zoomLabel);
    navBar->addAction(tr("+"), m_viewport, &ViewportController::zoomIn);
    navBar->addSeparator();
    navBar->addAction(m_undoAction);
    navBar->addAction(m_redoAction);
    navBar->addAction(m_exportAction);

    onZoomChanged(m_viewport->zoom());
}

void MainWindow::setupStyleBar()
{
    addToolBarBreak();
    QToolBar* styleBar = addToolBar(tr("Style"));
    styleBar->setObjectName("StyleToolBar");
    styleBar->setMovable(false);

    styleBar->addWidget(new QLabel(tr("Color "), styleBar));
    m_strokeColorButton = new QPushButton(styleBar);
    m_strokeColorButton->setFixedSize(28, 22);
    connect(m_strokeColorButton, &QPushButton::clicked, this, [this]() {
        const QColor color = QColorDialog::getColor(m_controller->settings().strokeColor, this, tr("Stroke Color"));
        if (color.isValid()) {
            m_controller->settings().strokeColor = color;
            setSwatch(m_strokeColorButton, color);
        }
    });
    styleBar->addWidget(m_strokeColorButton);

    styleBar->addWidget(new QLabel(tr(" Width "), styleBar));
    m_strokeWidthSpin = new QDoubleSpinBox(styleBar);
    m_strokeWidthSpin->setRange(1, 20);
    m_strokeWidthSpin->setDecimals(0);
    styleBar->addWidget(m_strokeWidthSpin);

    styleBar->addWidget(new QLabel(tr(" Font "), styleBar));
    m_fontSizeSpin = new QDoubleSpinBox(styleBar);
    m_fontSizeSpin->setRange(8, 72);
    m_fontSizeSpin->setDecimals(0);
    styleBar->addWidget(m_fontSizeSpin);

    styleBar->addSeparator();
    styleBar->addWidget(new QLabel(tr("Highlight "), styleBar));
    m_highlightColorButton = new QPushButton(styleBar);
    m_highlightColorButton->setFixedSize(28, 22);
    connect(m_highlightColorButton, &QPushButton::clicked, this, [this]() {
        const QColor color = QColorDialog::getColor(m_controller->settings().highlightColor, this, tr("Highlight Color"));
        if (color.isValid()) {
            m_controller->settings().highlightColor = color;
            setSwatch(m_highlightColorButton, color);
        }
    });
    styleBar->addWidget(m_highlightColorButton);

    m_redactCheck = new QCheckBox(tr("Redact"), styleBar);
    m_redactCheck->setToolTip(tr("Strike tool draws solid redaction boxes"));
    styleBar->addWidget(m_redactCheck);

    styleBar->addSeparator();
    styleBar->addWidget(new QLabel(tr("Stamp "), styleBar));
    m_stampCombo = new QComboBox(styleBar);
    for (const StampPreset& preset : StampAnnotation::presets()) {
        m_stampCombo->addItem(preset.label, preset.id);
    }
    m_stampCombo->addItem(tr("Custom"), QStringLiteral("custom"));
    styleBar->addWidget(m_stampCombo);

    m_stampTextEdit = new QLineEdit(styleBar);
    m_stampTextEdit->setPlaceholderText(tr("Custom text"));
    m_stampTextEdit->setMaximumWidth(120);
    styleBar->addWidget(m_stampTextEdit);

    m_stampShapeCombo = new QComboBox(styleBar);
    m_stampShapeCombo->addItem(tr("Box"), stampShapeName(StampShape::Box));
    m_stampShapeCombo->addItem(tr("Circle"), stampShapeName(StampShape::Circle));
    styleBar->addWidget(m_stampShapeCombo);

    m_stampDashedCheck = new QCheckBox(tr("Dashed"), styleBar);
    styleBar->addWidget(m_stampDashedCheck);

    styleBar->addSeparator();
    styleBar->addWidget(new QLabel(tr("Radio group "), styleBar));
    m_radioGroupSpin = new QSpinBox(styleBar);
    m_radioGroupSpin->setRange(1, 99);
    styleBar->addWidget(m_radioGroupSpin);

    syncStyleWidgets();

    connect(m_strokeWidthSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &MainWindow::applyStyleWidgets);
    connect(m_fontSizeSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &MainWindow::applyStyleWidgets);
    connect(m_redactCheck, &QCheckBox::toggled, this, &MainWindow::applyStyleWidgets);
    connect(m_stampTextEdit, &QLineEdit::textChanged, this, &MainWindow::applyStyleWidgets);
    connect(m_stampShapeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::applyStyleWidgets);
    connect(m_stampDashedCheck, &QCheckBox::toggled, this, &MainWindow::applyStyleWidgets);
    connect(m_radioGroupSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::applyStyleWidgets);
    connect(m_stampCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this]() {
        if (m_syncingStyle) {
            return;
        }
        const StampPreset* preset = StampAnnotation::findPreset(m_stampCombo->currentData().toString());
        if (preset) {
            m_controller->settings().stampColor = preset->color;
        }
        applyStyleWidgets();
    });
}

void MainWindow::syncStyleWidgets()
{
    const ToolSettings& s = m_controller->settings();
    m_syncingStyle = true;
    setSwatch(m_strokeColorButton, s.strokeColor);
    setSwatch(m_highlightColorButton, s.highlightColor);
    m_strokeWidthSpin->setValue(s.strokeWidth);
    m_fontSizeSpin->setValue(s.fontSize);
    m_redactCheck->setChecked(s.redactMode);
    const int stampIndex = m_stampCombo->findData(s.stampType);
    m_stampCombo->setCurrentIndex(stampIndex >= 0 ? stampIndex : 0);
    m_stampTextEdit->setText(s.stampCustomText);
    m_stampTextEdit->setEnabled(s.stampType == QLatin1String("custom"));
    m_stampShapeCombo->setCurrentIndex(s.stampShape == StampShape::Circle ? 1 : 0);
    m_stampDashedCheck->setChecked(s.stampDashed);
    m_radioGroupSpin->setValue(s.radioGroup);
    m_syncingStyle = false;
}

void MainWindow::applyStyleWidgets()
{
    if (m_syncingStyle) {
        return;
    }
    ToolSettings& s = m_controller->settings();
    s.strokeWidth = m_strokeWidthSpin->value();
    s.fontSize = m_fontSizeSpin->value();
    s.redactMode = m_redactCheck->isChecked();
    s.stampType = m_stampCombo->currentData().toString();
    s.stampCustomText = m_stampTextEdit->text();
    s.stampShape = stampShapeFromName(m_stampShapeCombo->currentData().toString());
    s.stampDashed = m_stampDashedCheck->isChecked();
    s.radioGroup = m_radioGroupSpin->value();
    m_stampTextEdit->setEnabled(s.stampType == QLatin1String("custom"));
}

void MainWindow::setSwatch(QPushButton* button, const QColor& color)
{
    button->setStyleSheet(QString("background-color: %1; border: 1px solid #888;").arg(color.name()));
}

// ============================================================================
// Session Wiring
// ============================================================================

void MainWindow::connectSession()
{
    // Viewport -> controller / cache
    connect(m_viewport, &ViewportController::documentLoaded, this, &MainWindow::onDocumentLoaded);
    connect(m_viewport, &ViewportController::pageChanged, this, &MainWindow::onPageChanged);
    connect(m_viewport, &ViewportController::zoomChanged, this, &MainWindow::onZoomChanged);
    connect(m_viewport, &ViewportController::rasterizationFailed, this, [this](int page, const QString& message) {
        showMessage(tr("Failed to render page %1: %2").arg(page).arg(message), 5000);
    });

    // Controller -> window
    connect(m_controller, &AnnotationToolController::toolChanged, this, &MainWindow::onToolChanged);
    connect(m_controller, &AnnotationToolController::annotationsChanged, this, &MainWindow::updateEditActions);
    connect(m_controller, &AnnotationToolController::selectionChanged, this, &MainWindow::updateEditActions);
    connect(m_controller, &AnnotationToolController::stateChanged, this, &MainWindow::updateEditActions);
    connect(m_controller, &AnnotationToolController::modalInputRequested, this, &MainWindow::onModalInputRequested,
            Qt::QueuedConnection);
    connect(m_controller, &AnnotationToolController::captureRequested, this, &MainWindow::onCaptureRequested,
            Qt::QueuedConnection);
    connect(m_controller, &AnnotationToolController::statusMessage, this, [this](const QString& message) {
        showMessage(message);
    });
    connect(m_controller, &AnnotationToolController::validationFailed, this, [this](const QString& message) {
        qWarning() << "[MainWindow] Rejected annotation:" << message;
        showMessage(message, 5000);
    });

    // Canvas -> window
    connect(m_canvas, &MarkupCanvas::shortcutTriggered, this, &MainWindow::onShortcutTriggered);

    // Export feedback
    connect(m_flattener, &MuPdfFlattener::exportComplete, this, [this](const QString& name, qint64 size) {
        showMessage(tr("Exported %1 (%2 KB)").arg(name).arg((size + 1023) / 1024), 5000);
    });
    connect(m_flattener, &MuPdfFlattener::exportFailed, this, [this](const QString& message) {
        showMessage(tr("Export failed: %1").arg(message), 5000);
    });
}

bool MainWindow::openDocument(const QString& path)
{
    QString error;
    if (!m_viewport->loadDocument(path, &error)) {
        QMessageBox::critical(this, tr("Open PDF"), tr("Failed to load PDF.\n\n%1").arg(error));
        return false;
    }
    return true;
}

void MainWindow::showOpenDialog()
{
    QSettings settings("PdfMarkup", "App");
    const QString lastDir = settings.value("lastOpenDir", QDir::homePath()).toString();

    const QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), lastDir, tr("PDF Files (*.pdf)"));
    if (path.isEmpty()) {
        return;
    }
    settings.setValue("lastOpenDir", QFileInfo(path).absolutePath());
    openDocument(path);
}

void MainWindow::onDocumentLoaded(int pageCount)
{
    m_controller->resetSession();
    m_rasterCache->clear();
    m_rasterCache->setCurrentPage(1);

    m_pageSpin->blockSignals(true);
    m_pageSpin->setRange(1, qMax(1, pageCount));
    m_pageSpin->setValue(1);
    m_pageSpin->blockSignals(false);
    m_pageSpin->setEnabled(pageCount > 1);
    m_pageCountLabel->setText(tr("of %1").arg(pageCount));

    const QString title = m_viewport->documentTitle().isEmpty()
        ? QFileInfo(m_viewport->documentPath()).fileName()
        : m_viewport->documentTitle();
    setWindowTitle(tr("%1 - PdfMarkup").arg(title));

    updateEditActions();
    m_canvas->setFocus();
    showMessage(tr("Loaded %n page(s)", nullptr, pageCount));
}

void MainWindow::onPageChanged(int page)
{
    m_controller->setCurrentPage(page);
    m_rasterCache->setCurrentPage(page);

    m_pageSpin->blockSignals(true);
    m_pageSpin->setValue(page);
    m_pageSpin->blockSignals(false);
    updateEditActions();
}

void MainWindow::onZoomChanged(qreal zoom)
{
    m_zoomLabel->setText(QString("%1%").arg(qRound(zoom * 100)));
}

void MainWindow::onToolChanged(ToolType tool)
{
    QAction* action = m_toolActions.value(tool);
    if (action && !action->isChecked()) {
        action->setChecked(true);
    }
}

void MainWindow::updateEditActions()
{
    const bool hasDocument = m_viewport->hasDocument();
    m_undoAction->setEnabled(m_controller->canUndo());
    m_redoAction->setEnabled(m_controller->canRedo());
    m_deleteAction->setEnabled(!m_controller->selectedId().isEmpty());
    m_revertAction->setEnabled(!m_controller->annotations().isEmpty());
    m_exportAction->setEnabled(hasDocument);
    m_prevPageAction->setEnabled(hasDocument && m_viewport->currentPage() > 1);
    m_nextPageAction->setEnabled(hasDocument && m_viewport->currentPage() < m_viewport->pageCount());
}

void MainWindow::onShortcutTriggered(const QString& actionId)
{
    if (actionId == QLatin1String("file.open")) {
        showOpenDialog();
    } else if (actionId == QLatin1String("file.export")) {
        exportPdf();
    }
}

// ============================================================================
// Modal Input
// ============================================================================

void MainWindow::onModalInputRequested(ToolType tool, const QPointF& position)
{
    Q_UNUSED(position);

    switch (tool) {
        case ToolType::Date: {
            DateDialog dialog(m_controller->settings().dateFormat, this);
            if (dialog.exec() != QDialog::Accepted) {
                m_controller->cancelModalInput();
                return;
            }
            m_controller->settings().dateFormat = dialog.format();
            if (!m_controller->placeDate(dialog.date())) {
                m_controller->cancelModalInput();
            }
            break;
        }

        case ToolType::SignedStamp: {
            SignedStampDialog dialog(m_controller->settings(), this);
            if (dialog.exec() != QDialog::Accepted) {
                m_controller->cancelModalInput();
                return;
            }
            m_controller->setSettings(dialog.settings());
            if (!m_controller->placeSignedStamp(dialog.signatureData(), dialog.date())) {
                m_controller->cancelModalInput();
            }
            break;
        }

        case ToolType::Watermark: {
            WatermarkDialog dialog(m_controller->settings(), this);
            if (dialog.exec() != QDialog::Accepted) {
                m_controller->cancelModalInput();
                return;
            }
            m_controller->setSettings(dialog.settings());
            if (!m_controller->placeWatermark()) {
                m_controller->cancelModalInput();
            }
            break;
        }

        default:
            m_controller->cancelModalInput();
            break;
    }
}

void MainWindow::onCaptureRequested(ToolType tool)
{
    switch (tool) {
        case ToolType::Signature:
        case ToolType::Initials:
            if (captureSignature(tool)) {
                showMessage(tool == ToolType::Signature
                                ? tr("Signature saved! Click on the PDF to place it.")
                                : tr("Initials saved! Click on the PDF to place them."));
            }
            break;

        case ToolType::Image: {
            const QString path = QFileDialog::getOpenFileName(this, tr("Add Image"), QString(), tr(IMAGE_FILTER));
            if (path.isEmpty()) {
                return;
            }
            QSize naturalSize;
            const QString data = RasterCache::encodeImageFile(path, &naturalSize);
            if (data.isEmpty()) {
                showMessage(tr("Please upload an image file"), 5000);
                return;
            }
            m_controller->stageImage(data, naturalSize);
            showMessage(tr("Click on the PDF to place the image."));
            break;
        }

        default:
            break;
    }
}

bool MainWindow::captureSignature(ToolType tool)
{
    const SignatureDialog::Kind kind = tool == ToolType::Initials ? SignatureDialog::Kind::Initials
                                                                  : SignatureDialog::Kind::Signature;
    SignatureDialog dialog(kind, this);
    if (dialog.exec() != QDialog::Accepted || dialog.dataUrl().isEmpty()) {
        return false;
    }
    if (kind == SignatureDialog::Kind::Initials) {
        m_controller->setInitialsData(dialog.dataUrl());
    } else {
        m_controller->setSignatureData(dialog.dataUrl());
    }
    return true;
}

void MainWindow::editSignature()
{
    if (captureSignature(ToolType::Signature)) {
        m_controller->setActiveTool(ToolType::Signature);
        showMessage(tr("Signature saved! Click on the PDF to place it."));
    }
}

void MainWindow::editInitials()
{
    if (captureSignature(ToolType::Initials)) {
        m_controller->setActiveTool(ToolType::Initials);
        showMessage(tr("Initials saved! Click on the PDF to place them."));
    }
}

void MainWindow::insertImage()
{
    if (!m_viewport->hasDocument()) {
        onToolChanged(m_controller->activeTool());
        return;
    }

    const QString path = QFileDialog::getOpenFileName(this, tr("Add Image"), QString(), tr(IMAGE_FILTER));
    if (path.isEmpty()) {
        onToolChanged(m_controller->activeTool());
        return;
    }

    QSize naturalSize;
    const QString data = RasterCache::encodeImageFile(path, &naturalSize);
    if (data.isEmpty()) {
        showMessage(tr("Please upload an image file"), 5000);
        onToolChanged(m_controller->activeTool());
        return;
    }
    m_controller->placeImage(data, naturalSize);
    onToolChanged(m_controller->activeTool());
}

// ============================================================================
// Export
// ============================================================================

void MainWindow::exportPdf()
{
    if (!m_viewport->hasDocument()) {
        return;
    }

    // Commit an in-progress text edit so it is part of the export
    m_controller->finishTextEditing();

    const FlattenRequest request = PdfFlattenPayload::buildRequest(
        m_viewport->documentBytes(), m_controller->annotations(), ViewportController::RENDER_SCALE);

    QApplication::setOverrideCursor(Qt::WaitCursor);
    showMessage(tr("Exporting..."), 0);
    const FlattenResult result = m_flattener->flatten(request);
    QApplication::restoreOverrideCursor();

    if (!result.success) {
        QMessageBox::critical(this, tr("Export Failed"), result.errorMessage);
        return;
    }

    const QString defaultPath = QFileInfo(m_viewport->documentPath()).absoluteDir().filePath(result.downloadName);
    QString exportPath = QFileDialog::getSaveFileName(this, tr("Save Filled PDF"), defaultPath, tr("PDF Files (*.pdf)"));
    if (exportPath.isEmpty()) {
        return;
    }
    if (!exportPath.endsWith(".pdf", Qt::CaseInsensitive)) {
        exportPath += ".pdf";
    }

    QSaveFile file(exportPath);
    if (!file.open(QIODevice::WriteOnly) || file.write(result.document) != result.document.size()
        || !file.commit()) {
        QMessageBox::critical(this, tr("Export Failed"),
                              tr("Could not write %1:\n%2").arg(exportPath, file.errorString()));
        return;
    }

    showMessage(tr("PDF downloaded successfully!"), 5000);
}

// ============================================================================
// Window Events
// ============================================================================

void MainWindow::showMessage(const QString& message, int timeoutMs)
{
    statusBar()->showMessage(message, timeoutMs);
}

void MainWindow::resizeEvent(QResizeEvent* event)
{
    QMainWindow::resizeEvent(event);
    m_environment.setWindowWidth(event->size().width());
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    m_controller->finishTextEditing();
    m_controller->settings().save();

    QSettings settings("PdfMarkup", "App");
    settings.setValue("window/geometry", saveGeometry());

    m_viewport->closeDocument();
    event->accept();
}
